#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace bounded_flow {
namespace errors {
enum class bounded_flow_err {
    // no 0
    not_called = 1,
    write_after_end,
    stream_closed,
};

std::error_code make_error_code(bounded_flow_err e);

}  // namespace errors

// Raised synchronously for invalid options, before any input is processed.
class config_error : public std::invalid_argument {
   public:
    explicit config_error(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace bounded_flow

namespace std {
template <>
struct is_error_code_enum<bounded_flow::errors::bounded_flow_err> : true_type {};
}  // namespace std
