#pragma once

#include "config.hpp"
#include "invocation.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;

    enum class session_state : uint8_t {
        not_started,
        started,
        initializing,
        ready,
        shutting_down,
        terminated,
    };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::not_started:
                return "not_started"sv;
            case session_state::started:
                return "started"sv;
            case session_state::initializing:
                return "initializing"sv;
            case session_state::ready:
                return "ready"sv;
            case session_state::shutting_down:
                return "shutting_down"sv;
            case session_state::terminated:
                return "terminated"sv;
        }
        return "terminated"sv;
    }

    struct handshake_info {
        std::string protocol_version{};
        server_info server{};
        glz::generic capabilities = glz::generic::object_t{};
    };

    /*
     * One tool server child and everything needed to talk to it.
     *
     *   not_started --start--> started --initialize--> initializing --(initialized sent)--> ready
     *   ready --discover_tools/invoke_tool--> ready
     *   started|initializing|ready --cleanup--> shutting_down --> terminated
     *   any --transport failure--> terminated
     *
     * Operations issued from the wrong state throw session_error(out_of_order)
     * before anything is written to the child.
     */
    class session {
      public:
        explicit session(session_config cfg);
        session(session_config cfg, std::unique_ptr<transport> channel);
        ~session();

        session(const session&) = delete;
        session& operator=(const session&) = delete;

        void start();
        const handshake_info& initialize();
        std::vector<tool> discover_tools();
        tool_result invoke_tool(std::string_view name, const glz::generic::object_t& arguments);

        // Never throws; safe to call repeatedly and from any state
        void cleanup();

        std::optional<tool> lookup_tool(std::string_view name) const { return catalog_.lookup(name); }
        std::vector<tool> tools() const { return catalog_.tools(); }

        session_state state() const { return state_; }
        const session_config& config() const { return cfg_; }
        const std::optional<handshake_info>& handshake() const { return handshake_; }
        std::string diagnostics();

      private:
        session_config cfg_;
        std::unique_ptr<transport> transport_;
        correlator rpc_;
        tool_catalog catalog_{};
        invocation_engine invoker_;
        session_state state_{session_state::not_started};
        std::optional<handshake_info> handshake_{};

        void require_state(session_state expected, std::string_view operation) const;
        void transition(session_state next);
        void force_terminate(const session_error& cause);

        template <typename F>
        decltype(auto) guarded(F&& op);
    };

}  // namespace conduit
