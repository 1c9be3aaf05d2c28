#pragma once

#include <algorithm>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dtex {

    namespace log {
        inline bool& verbose_flag() {
            static bool enabled = false;
            return enabled;
        }

        inline void set_verbose(bool enabled) {
            verbose_flag() = enabled;
        }

        inline bool verbose() {
            return verbose_flag();
        }
    }  // namespace log

    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    // Verbose trace logger; silent unless log::set_verbose(true)
    template <typename... Args>
    struct trace_log {
        explicit trace_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            if (!log::verbose()) {
                return;
            }
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };

    // deduction guide
    template <typename... Args>
    trace_log(Args&&...) -> trace_log<Args...>;

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

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace dtex
