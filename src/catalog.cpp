#include "conduit/catalog.hpp"

#include "conduit/format.hpp"

#include <algorithm>
#include <unordered_set>

using namespace conduit::literals;

namespace conduit {

    namespace detail {

        struct tools_list_payload {
            std::vector<glz::generic> tools{};
            struct glaze {
                using T = tools_list_payload;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        static const glz::generic::object_t* find_object(const glz::generic::object_t& obj, std::string_view key) {
            auto it = obj.find(key);
            if (it == obj.end() || !it->second.is_object()) {
                return nullptr;
            }
            return &it->second.get<glz::generic::object_t>();
        }

        static std::optional<std::string> find_string(const glz::generic::object_t& obj, std::string_view key) {
            auto it = obj.find(key);
            if (it == obj.end() || !it->second.is_string()) {
                return std::nullopt;
            }
            return it->second.get<std::string>();
        }

        // Returns the reason an entry is unusable, or nullopt when it is a valid tool
        static std::optional<std::string> validate_entry(const glz::generic& entry, tool& out) {
            if (!entry.is_object()) {
                return "entry is not an object";
            }
            const auto& obj = entry.get<glz::generic::object_t>();

            auto name = find_string(obj, "name");
            if (!name || name->empty()) {
                return "missing name";
            }
            auto description = find_string(obj, "description");
            if (!description || description->empty()) {
                return "tool '{}' has no description"_format(*name);
            }
            auto it = obj.find("inputSchema");
            if (it == obj.end() || !it->second.is_object()) {
                return "tool '{}' has no inputSchema object"_format(*name);
            }

            out = tool{.name = std::move(*name), .description = std::move(*description), .input_schema = it->second};
            return std::nullopt;
        }

        static std::string serialize_schema(const glz::generic& schema) {
            auto json = glz::write_json(schema);
            return json ? *json : std::string{};
        }

    }  // namespace detail

    std::vector<tool_parameter> tool::parameters() const {
        std::vector<tool_parameter> out{};
        if (!input_schema.is_object()) {
            return out;
        }
        const auto& schema = input_schema.get<glz::generic::object_t>();
        auto required = required_arguments();

        if (const auto* props = detail::find_object(schema, "properties")) {
            for (const auto& [param_name, info] : *props) {
                tool_parameter param{.name = param_name};
                if (info.is_object()) {
                    const auto& info_obj = info.get<glz::generic::object_t>();
                    param.type = detail::find_string(info_obj, "type").value_or("unknown");
                    param.description = detail::find_string(info_obj, "description").value_or("");
                }
                else {
                    param.type = "unknown";
                }
                param.required = std::ranges::find(required, param_name) != required.end();
                out.push_back(std::move(param));
            }
        }
        return out;
    }

    std::vector<std::string> tool::required_arguments() const {
        std::vector<std::string> out{};
        if (!input_schema.is_object()) {
            return out;
        }
        const auto& schema = input_schema.get<glz::generic::object_t>();
        auto it = schema.find("required");
        if (it == schema.end() || !it->second.is_array()) {
            return out;
        }
        for (const auto& item : it->second.get<glz::generic::array_t>()) {
            if (item.is_string()) {
                out.push_back(item.get<std::string>());
            }
        }
        return out;
    }

    std::optional<std::string> tool::declared_type(std::string_view parameter) const {
        if (!input_schema.is_object()) {
            return std::nullopt;
        }
        const auto* props = detail::find_object(input_schema.get<glz::generic::object_t>(), "properties");
        if (!props) {
            return std::nullopt;
        }
        const auto* info = detail::find_object(*props, parameter);
        if (!info) {
            return std::nullopt;
        }
        return detail::find_string(*info, "type");
    }

    bool operator==(const tool& lhs, const tool& rhs) {
        return lhs.name == rhs.name && lhs.description == rhs.description &&
               detail::serialize_schema(lhs.input_schema) == detail::serialize_schema(rhs.input_schema);
    }

    tool_catalog::tool_catalog() : tools_{std::make_shared<const std::vector<tool>>()} {}

    std::vector<tool> tool_catalog::discover(correlator& rpc) {
        auto resp = rpc.send(methods::tools_list);
        if (resp.error) {
            throw session_error{
                    error_kind::remote_tool_error,
                    "tools/list failed: {}"_format(resp.error->message),
                    resp.error->code};
        }

        std::vector<std::string> rejected{};
        auto listing = parse_listing(*resp.result, &rejected);
        for (const auto& reason : rejected) {
            log_message(log_level::warn, "ignoring catalog entry: ", reason);
        }

        replace(listing);
        debug_log("discovered ", listing.size(), " tools");
        return listing;
    }

    std::vector<tool> tool_catalog::parse_listing(const glz::raw_json& result, std::vector<std::string>* rejected) {
        auto payload = read_payload<detail::tools_list_payload>(result, "tools/list");

        std::vector<tool> out{};
        std::unordered_set<std::string> seen{};
        for (std::size_t i = 0; i < payload.tools.size(); ++i) {
            tool entry{};
            auto reason = detail::validate_entry(payload.tools[i], entry);
            if (!reason && !seen.insert(entry.name).second) {
                reason = "duplicate tool name '{}'"_format(entry.name);
            }
            if (reason) {
                if (rejected) {
                    rejected->push_back("#{}: {}"_format(i, *reason));
                }
                continue;
            }
            out.push_back(std::move(entry));
        }
        return out;
    }

    void tool_catalog::replace(std::vector<tool> tools) {
        auto next = std::make_shared<const std::vector<tool>>(std::move(tools));
        std::lock_guard lock{mutex_};
        tools_ = std::move(next);
    }

    std::optional<tool> tool_catalog::lookup(std::string_view name) const {
        auto snap = current();
        auto it = std::ranges::find(*snap, name, &tool::name);
        if (it == snap->end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<tool> tool_catalog::tools() const {
        return *current();
    }

    std::size_t tool_catalog::size() const {
        return current()->size();
    }

    tool_catalog::snapshot tool_catalog::current() const {
        std::lock_guard lock{mutex_};
        return tools_;
    }

}  // namespace conduit
