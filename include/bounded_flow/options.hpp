#pragma once

#include <string>

namespace bounded_flow {

struct bounded_opts {
    // maximum number of operations outstanding at the same time, must be at least 1.
    int concurrency_limit = 1;
    // shows up in log lines.
    std::string name = "bounded_flow";
};

// throws config_error when opts cannot be used.
const bounded_opts& validate(const bounded_opts& opts);

}  // namespace bounded_flow
