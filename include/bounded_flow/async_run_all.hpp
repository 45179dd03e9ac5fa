#pragma once

#include "bounded_flow/async_callback.hpp"
#include "bounded_flow/bounded_executor.hpp"
#include "bounded_flow/cancellation_token.hpp"
#include "bounded_flow/log.hpp"
#include "bounded_flow/options.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <system_error>
#include <utility>
#include <variant>

namespace bounded_flow {

namespace details {

template <class Container, class Handler, class LogFns>
struct run_all_state {
    using iter_type = typename Container::const_iterator;
    using executor_t = bounded_executor<iter_type, std::monostate, LogFns>;

    run_all_state(Container c, Handler handler, async_callback<std::size_t, LogFns> done)
        : items(std::move(c)), handler(std::move(handler)), done(std::move(done)) {}

    void finish(std::error_code ec) {
        if (done) {
            auto d = std::move(done);
            d(ec, processed);
        }
        // breaks executor -> handler -> state -> executor.
        executor.reset();
    }

    const Container items;
    Handler handler;
    async_callback<std::size_t, LogFns> done;
    std::size_t processed = 0;
    std::shared_ptr<executor_t> executor;
};

}  // namespace details

// Runs handler over every item with at most concurrency_limit of them outstanding.
//
// handler: void(const Item&, cancellation_token&, async_callback<void>).
// finished_cb: void(std::error_code, std::size_t), gets ({}, items processed) once everything settled. The first failure is reported right
// away as (ec, items processed so far): queued items are dropped, running ones cancelled and
// their outcomes ignored.
// Throws config_error for concurrency_limit < 1 before touching any item or finished_cb.
template <class LogFns = details::default_log_fns_t, class Container, class Handler, class FinishCallback>
void async_run_all(Container items, int concurrency_limit, Handler handler, FinishCallback finished_cb) {
    bounded_opts opts;
    opts.concurrency_limit = concurrency_limit;
    opts.name = "async_run_all";
    validate(opts);

    using state_t = details::run_all_state<Container, Handler, LogFns>;
    using iter_type = typename state_t::iter_type;

    auto state = std::make_shared<state_t>(
        std::move(items), std::move(handler),
        async_callback<std::size_t, LogFns>(std::move(finished_cb), opts.name));

    executor_hooks<std::monostate> hooks;
    hooks.on_result = [state](std::monostate) { state->processed++; };
    hooks.on_failure = [state](std::error_code ec) { state->finish(ec); };

    state->executor = make_bounded_executor<iter_type, std::monostate, LogFns>(
        std::move(opts),
        [state](iter_type it, cancellation_token& token, async_callback<std::monostate, LogFns> settle) {
            state->handler(*it, token, async_callback<void, LogFns>([settle = std::move(settle)](
                                                                         std::error_code ec) mutable {
                settle(ec, std::monostate{});
            }, "async_run_all"));
        },
        std::move(hooks));

    // keep the executor alive while admitting, a failure may already finish the run.
    auto executor = state->executor;
    for (auto it = std::cbegin(state->items); it != std::cend(state->items); ++it) {
        if (executor->admit(it) == admission::rejected) {
            break;
        }
    }
    executor->drain_and_wait(async_callback<void, LogFns>(
        [state](std::error_code ec) {
            if (!ec) {
                state->finish(std::error_code());
            }
        },
        "async_run_all"));
}

}  // namespace bounded_flow
