#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cmath>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

    using namespace std::string_view_literals;

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

// Debug logger; no-op on release builds
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    enum class log_level { debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "warn"sv;
    }

    namespace detail {
        inline std::atomic<log_level>& log_threshold_ref() {
            static std::atomic<log_level> threshold{log_level::warn};
            return threshold;
        }
    }  // namespace detail

    inline log_level log_threshold() {
        return detail::log_threshold_ref().load(std::memory_order_relaxed);
    }

    inline void set_log_threshold(log_level level) {
        detail::log_threshold_ref().store(level, std::memory_order_relaxed);
    }

    inline bool log_enabled(log_level level) {
        return level != log_level::off && level >= log_threshold();
    }

    // Leveled stderr logger; stdout belongs to the protocol stream
    template <typename... Args>
    struct log_message {
        constexpr explicit log_message(
                log_level level, Args&&... args, const std::source_location& loc = std::source_location::current()) {
            if (!log_enabled(level)) {
                return;
            }
            std::cerr << '[' << to_string(level) << "] ";
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };

    template <typename... Args>
    log_message(log_level, Args&&...) -> log_message<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        // Renders a double the way a floating-point literal reads: always with a
        // fractional part or an exponent ("42.0", "0.5", "1e+16", "inf").
        inline std::string format_float(double value) {
            if (std::isnan(value)) {
                return "nan";
            }
            if (std::isinf(value)) {
                return value < 0 ? "-inf" : "inf";
            }

            char buf[64]{};
            auto magnitude = std::fabs(value);
            auto fmt = (magnitude != 0.0 && (magnitude < 1e-4 || magnitude >= 1e16)) ? std::chars_format::scientific
                                                                                      : std::chars_format::fixed;
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, fmt);
            if (ec != std::errc{}) {
                return "nan";
            }

            std::string out{buf, ptr};
            if (fmt == std::chars_format::fixed && out.find('.') == std::string::npos) {
                out += ".0";
            }
            return out;
        }

        inline std::vector<std::string> split_whitespace(std::string_view input) {
            std::vector<std::string> out{};
            std::size_t pos = 0;
            while (pos < input.size()) {
                auto start = input.find_first_not_of(" \t\r\n", pos);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = input.find_first_of(" \t\r\n", start);
                if (end == std::string_view::npos) {
                    end = input.size();
                }
                out.emplace_back(input.substr(start, end - start));
                pos = end;
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace conduit
