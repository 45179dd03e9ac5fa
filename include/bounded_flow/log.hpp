#pragma once

#include <fmt/format.h>
#include <iostream>
#include <string_view>

namespace bounded_flow::details {

// Logging policy used by default. Components take it as a template parameter, so
// tests and applications can route lines elsewhere by passing a type with the same
// static members.
struct default_log_fns_t {
    template <class... Args>
    static void print_error_line(std::string_view fmt_str, Args&&... args) {
        std::cerr << "ERROR: " << fmt::vformat(fmt_str, fmt::make_format_args(args...)) << "\n";
    }

    template <class... Args>
    static void print_warning_line(std::string_view fmt_str, Args&&... args) {
        std::cerr << "WARNING: " << fmt::vformat(fmt_str, fmt::make_format_args(args...)) << "\n";
    }
};

}  // namespace bounded_flow::details
