#include "conduit/correlator.hpp"

#include "conduit/format.hpp"

#include <variant>

using namespace conduit::literals;

namespace conduit {

    std::string pending_request::to_string() const {
        return "#{} {}"_format(id, method);
    }

    correlator::correlator(transport& channel) : transport_{channel} {}

    response_message correlator::send(std::string_view method, std::optional<glz::raw_json> params) {
        if (pending_) {
            throw session_error{
                    error_kind::protocol_violation, "request {} is still awaiting its response"_format(*pending_)};
        }

        // ids are consumed even when the write fails, so they are never reused
        auto id = next_id_++;
        auto frame = serialize_request(id, method, params);
        pending_ = pending_request{.id = id, .method = std::string{method}, .issued_at = std::chrono::steady_clock::now()};

        try {
            transport_.write_line(frame);
            auto resp = await_response();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - pending_->issued_at);
            debug_log("request ", pending_->to_string(), " answered in ", elapsed.count(), "ms");
            pending_.reset();
            return resp;
        } catch (...) {
            pending_.reset();
            throw;
        }
    }

    void correlator::notify(std::string_view method, std::optional<glz::raw_json> params) {
        transport_.write_line(serialize_notification(method, params));
    }

    void correlator::abandon() {
        if (pending_) {
            debug_log("abandoning request ", pending_->to_string());
        }
        pending_.reset();
    }

    response_message correlator::await_response() {
        for (;;) {
            auto line = transport_.read_line();
            if (!line) {
                throw session_error{
                        error_kind::transport_failure,
                        "server closed its output while {} was pending"_format(*pending_)};
            }
            if (utils::trim_view(*line).empty()) {
                continue;
            }

            auto msg = parse_message(*line);

            if (auto* resp = std::get_if<response_message>(&msg)) {
                if (resp->has_id(pending_->id)) {
                    return std::move(*resp);
                }
                throw session_error{
                        error_kind::protocol_violation,
                        "response id {} does not match pending request {}"_format(describe_id(resp->id), *pending_)};
            }
            if (auto* req = std::get_if<request_message>(&msg)) {
                throw session_error{
                        error_kind::protocol_violation,
                        "unexpected server request '{}' while {} was pending"_format(req->method, *pending_)};
            }
            auto& note = std::get<notification_message>(msg);
            throw session_error{
                    error_kind::protocol_violation,
                    "unexpected server notification '{}' while {} was pending"_format(note.method, *pending_)};
        }
    }

}  // namespace conduit
