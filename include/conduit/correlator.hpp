#pragma once

#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conduit {

    struct pending_request {
        static constexpr bool to_string_formattable = true;

        int64_t id{};
        std::string method{};
        std::chrono::steady_clock::time_point issued_at{};

        std::string to_string() const;
    };

    // Single-slot request/response matcher over one transport. Only one request is
    // ever in flight, so responses are consumed strictly in issuance order.
    class correlator {
      public:
        explicit correlator(transport& channel);

        // Writes a request and blocks until the response carrying its id arrives.
        // Throws session_error: transport_failure (write failed, end-of-stream),
        // malformed_response (unparsable line), protocol_violation (any other
        // well-formed message read first).
        response_message send(std::string_view method, std::optional<glz::raw_json> params = std::nullopt);

        // Fire-and-forget notification; never reads.
        void notify(std::string_view method, std::optional<glz::raw_json> params = std::nullopt);

        // Drops the in-flight slot when the session is torn down mid-request
        void abandon();

        int64_t last_issued_id() const { return next_id_ - 1; }
        const std::optional<pending_request>& pending() const { return pending_; }

      private:
        transport& transport_;
        int64_t next_id_{1};
        std::optional<pending_request> pending_{};

        response_message await_response();
    };

}  // namespace conduit
