#pragma once

#include <function2/function2.hpp>

#include <utility>

namespace bounded_flow {

// token is a thing that allows to cancel an async operation.
//
// implementors of async operations hook their implementation specific cancellation
// mechanism into impl; owners call cancel() when the result is no longer wanted.
// operations that cannot be cancelled leave impl empty and simply get ignored when
// they settle.
struct cancellation_token {
    cancellation_token() = default;
    cancellation_token(const cancellation_token&) = delete;
    cancellation_token& operator=(const cancellation_token&) = delete;

    void cancel() {
        if (impl) {
            std::exchange(impl, nullptr)();
        }
    }

    // forget the cancellation hook without running it, used once the operation settled.
    void reset() { impl = nullptr; }

    bool cancellable() const { return static_cast<bool>(impl); }

    fu2::unique_function<void()> impl;
};

}  // namespace bounded_flow
