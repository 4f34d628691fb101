#pragma once

#include "correlator.hpp"

#include <glaze/glaze.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    struct tool_parameter {
        std::string name{};
        std::string type{};
        std::string description{};
        bool required{false};
    };

    struct tool {
        std::string name{};
        std::string description{};
        glz::generic input_schema = glz::generic::object_t{};

        // Declared parameters sorted by name, each flagged against the schema's `required` list
        std::vector<tool_parameter> parameters() const;
        std::vector<std::string> required_arguments() const;
        std::optional<std::string> declared_type(std::string_view parameter) const;
    };

    // Name, description and serialized schema all match
    bool operator==(const tool& lhs, const tool& rhs);

    class tool_catalog {
      public:
        tool_catalog();

        // Issues one tools/list request and swaps in the validated listing. Entries
        // missing a name, description or schema object are dropped with a warning.
        std::vector<tool> discover(correlator& rpc);

        void replace(std::vector<tool> tools);
        std::optional<tool> lookup(std::string_view name) const;
        std::vector<tool> tools() const;
        std::size_t size() const;

        // Validates a raw tools/list result; rejected entries are reported through `rejected`
        static std::vector<tool> parse_listing(const glz::raw_json& result, std::vector<std::string>* rejected = nullptr);

      private:
        using snapshot = std::shared_ptr<const std::vector<tool>>;

        mutable std::mutex mutex_{};
        snapshot tools_{};

        snapshot current() const;
    };

}  // namespace conduit
