#pragma once

#include "bounded_flow/async_callback.hpp"
#include "bounded_flow/bounded_executor.hpp"
#include "bounded_flow/cancellation_token.hpp"
#include "bounded_flow/log.hpp"

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <system_error>
#include <utility>

namespace bounded_flow {

namespace details {

template <class Output, class LogFns>
struct deadline_control_block {
    deadline_control_block(asio::steady_timer timer, async_callback<Output, LogFns> done)
        : timer(std::move(timer)), done(std::move(done)) {}

    void settle(std::error_code ec, Output result) {
        if (settled) {
            return;
        }
        settled = true;
        timer.cancel();
        inner.reset();
        done(ec, std::move(result));
    }

    bool settled = false;
    asio::steady_timer timer;
    // handed to the wrapped handler.
    cancellation_token inner;
    async_callback<Output, LogFns> done;
};

}  // namespace details

// Wraps an executor handler so that every operation fails with std::errc::timed_out when it
// does not settle within timeout. On expiry the wrapped operation's token gets cancelled and
// whatever it delivers later is dropped. Cancelling the outer token stops the timer and cancels
// the wrapped operation.
template <class Input, class Output, class LogFns = details::default_log_fns_t>
typename bounded_executor<Input, Output, LogFns>::handler_t with_timeout(
    asio::io_context& ctx,
    typename bounded_executor<Input, Output, LogFns>::handler_t handler,
    std::chrono::steady_clock::duration timeout) {
    using control_block_t = details::deadline_control_block<Output, LogFns>;

    return [&ctx, timeout, handler = std::move(handler)](Input input, cancellation_token& token,
                                                         async_callback<Output, LogFns> done) mutable {
        auto control_block = std::make_shared<control_block_t>(asio::steady_timer(ctx), std::move(done));

        control_block->timer.expires_after(timeout);
        control_block->timer.async_wait([control_block](std::error_code ec) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                LogFns::print_error_line("bounded_flow: with_timeout: timer error: {}", ec.message());
            }
            if (control_block->settled) {
                return;
            }
            // settled first, the wrapped operation may report its cancellation synchronously.
            control_block->settled = true;
            control_block->inner.cancel();
            control_block->done(make_error_code(std::errc::timed_out), Output{});
        });

        token.impl = [weak_block = std::weak_ptr<control_block_t>(control_block)] {
            auto control_block = weak_block.lock();
            if (!control_block || control_block->settled) {
                return;
            }
            control_block->settled = true;
            control_block->timer.cancel();
            control_block->inner.cancel();
            control_block->done(make_error_code(std::errc::operation_canceled), Output{});
        };

        handler(std::move(input), control_block->inner,
                async_callback<Output, LogFns>(
                    [control_block](std::error_code ec, Output result) {
                        control_block->settle(ec, std::move(result));
                    },
                    "with_timeout"));
    };
}

}  // namespace bounded_flow
