#pragma once

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace rigor {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << "[rigor " << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

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

        constexpr std::optional<bool> parse_bool(std::string_view input) {
            input = trim_view(input);
            if (str_case_eq(input, "1") || str_case_eq(input, "true") || str_case_eq(input, "yes") ||
                str_case_eq(input, "on")) {
                return true;
            }
            if (str_case_eq(input, "0") || str_case_eq(input, "false") || str_case_eq(input, "no") ||
                str_case_eq(input, "off")) {
                return false;
            }
            return std::nullopt;
        }

        // Splits on '\n'; a trailing '\r' is dropped from each line and a final
        // unterminated line is kept. "a\nb\n" and "a\nb" both give {"a", "b"}.
        inline std::vector<std::string> split_lines(std::string_view text) {
            std::vector<std::string> lines{};
            size_t start = 0U;
            while (start < text.size()) {
                auto end = text.find('\n', start);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                auto line = text.substr(start, end - start);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1U);
                }
                lines.emplace_back(line);
                start = end + 1U;
            }
            return lines;
        }

    }  // namespace utils

}  // namespace rigor
