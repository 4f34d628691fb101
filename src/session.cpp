#include "conduit/session.hpp"

#include "conduit/format.hpp"

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        struct handshake_payload {
            std::string protocolVersion{};
            server_info serverInfo{};
            glz::generic capabilities = glz::generic::object_t{};
            struct glaze {
                using T = handshake_payload;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "serverInfo",
                        &T::serverInfo,
                        "capabilities",
                        &T::capabilities);
            };
        };

    }  // namespace detail

    session::session(session_config cfg) : session(std::move(cfg), std::make_unique<process_transport>()) {}

    session::session(session_config cfg, std::unique_ptr<transport> channel)
            : cfg_{std::move(cfg)}, transport_{std::move(channel)}, rpc_{*transport_}, invoker_{rpc_, catalog_} {}

    session::~session() {
        cleanup();
    }

    template <typename F>
    decltype(auto) session::guarded(F&& op) {
        try {
            return op();
        } catch (const session_error& e) {
            if (e.kind() == error_kind::transport_failure) {
                force_terminate(e);
            }
            throw;
        }
    }

    void session::start() {
        require_state(session_state::not_started, "start"sv);

        launch_options opts{
                .command = cfg_.server_command,
                .working_directory = cfg_.working_directory,
                .settle = std::chrono::milliseconds{cfg_.settle_ms},
                .read_timeout = std::chrono::milliseconds{cfg_.response_timeout_ms}};
        try {
            transport_->start(opts);
        } catch (const session_error& e) {
            log_message(log_level::error, "failed to start server: ", e.what());
            state_ = session_state::terminated;
            throw;
        }
        transition(session_state::started);
    }

    const handshake_info& session::initialize() {
        require_state(session_state::started, "initialize"sv);

        return guarded([this]() -> const handshake_info& {
            initialize_params params{
                    .protocolVersion = cfg_.protocol_version,
                    .capabilities = glz::generic::object_t{},
                    .clientInfo = client_info{.name = cfg_.client_name, .version = cfg_.client_version}};

            auto resp = rpc_.send(methods::initialize, to_raw_json(params));
            if (resp.error) {
                throw session_error{
                        error_kind::remote_tool_error,
                        "initialize rejected: {}"_format(resp.error->message),
                        resp.error->code};
            }

            auto payload = read_payload<detail::handshake_payload>(*resp.result, "initialize");
            if (payload.serverInfo.name.empty()) {
                log_message(log_level::warn, "server did not identify itself in serverInfo");
            }
            if (!payload.protocolVersion.empty() && payload.protocolVersion != cfg_.protocol_version) {
                log_message(
                        log_level::warn,
                        "server answered with protocol ",
                        payload.protocolVersion,
                        ", requested ",
                        cfg_.protocol_version);
            }
            handshake_ = handshake_info{
                    .protocol_version = std::move(payload.protocolVersion),
                    .server = std::move(payload.serverInfo),
                    .capabilities = std::move(payload.capabilities)};
            transition(session_state::initializing);

            rpc_.notify(methods::initialized);
            transition(session_state::ready);
            return *handshake_;
        });
    }

    std::vector<tool> session::discover_tools() {
        require_state(session_state::ready, "discover_tools"sv);
        return guarded([this] { return catalog_.discover(rpc_); });
    }

    tool_result session::invoke_tool(std::string_view name, const glz::generic::object_t& arguments) {
        require_state(session_state::ready, "invoke_tool"sv);
        return guarded([&] { return invoker_.invoke(name, arguments); });
    }

    void session::cleanup() {
        if (state_ == session_state::terminated) {
            return;
        }
        if (state_ == session_state::not_started) {
            state_ = session_state::terminated;
            return;
        }

        transition(session_state::shutting_down);
        rpc_.abandon();
        try {
            transport_->terminate(std::chrono::milliseconds{cfg_.grace_ms});
        } catch (const std::exception& e) {
            log_message(log_level::warn, "error while stopping server: ", e.what());
        }
        transition(session_state::terminated);
    }

    std::string session::diagnostics() {
        return transport_->diagnostics();
    }

    void session::require_state(session_state expected, std::string_view operation) const {
        if (state_ != expected) {
            throw session_error{
                    error_kind::out_of_order,
                    "{} requires a {} session, current state is {}"_format(
                            operation, to_string(expected), to_string(state_))};
        }
    }

    void session::transition(session_state next) {
        debug_log("session ", to_string(state_), " -> ", to_string(next));
        state_ = next;
    }

    void session::force_terminate(const session_error& cause) {
        log_message(log_level::warn, "terminating session after ", cause.to_string());
        rpc_.abandon();
        transport_->terminate(std::chrono::milliseconds{cfg_.grace_ms});
        transition(session_state::terminated);
    }

}  // namespace conduit
