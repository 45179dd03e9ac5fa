#include "bounded_flow/options.hpp"

#include "bounded_flow/errors.hpp"

#include <fmt/format.h>

namespace bounded_flow {

const bounded_opts& validate(const bounded_opts& opts) {
    if (opts.concurrency_limit < 1) {
        throw config_error(
            fmt::format("{}: concurrency_limit must be at least 1, got {}", opts.name, opts.concurrency_limit));
    }
    return opts;
}

}  // namespace bounded_flow
