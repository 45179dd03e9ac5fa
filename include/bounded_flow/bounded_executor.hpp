#pragma once

#include "bounded_flow/async_callback.hpp"
#include "bounded_flow/cancellation_token.hpp"
#include "bounded_flow/log.hpp"
#include "bounded_flow/options.hpp"

#include <function2/function2.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bounded_flow {

enum class admission {
    started,   // a slot was free, the operation is running.
    queued,    // limit reached, the input waits in the pending queue.
    rejected,  // executor is draining or stopped.
};

template <class Output>
struct executor_hooks {
    fu2::unique_function<void(Output)> on_result;
    fu2::unique_function<void(std::error_code)> on_failure;
    // a queued input has been started, argument is the number of inputs still queued.
    fu2::unique_function<void(std::size_t)> on_dequeued;
};

// Runs handler for admitted inputs keeping at most opts.concurrency_limit of them outstanding.
//
// Inputs that do not fit are queued and started in admission order as slots free up. The first
// failed operation stops the executor: queued inputs are dropped, running operations get their
// cancellation token fired, and whatever they deliver afterwards is discarded.
//
// Everything happens on one thread, usually from inside an io_context. Handler signature:
//   void(Input, cancellation_token&, async_callback<Output>)
// the token stays valid at least until the handler returns; a hook installed after the job
// settled or got cancelled is never run.
// Output has to be default constructible.
template <class Input, class Output, class LogFns = details::default_log_fns_t>
class bounded_executor : public std::enable_shared_from_this<bounded_executor<Input, Output, LogFns>> {
   public:
    using settle_callback_t = async_callback<Output, LogFns>;
    using handler_t = fu2::unique_function<void(Input, cancellation_token&, settle_callback_t)>;
    using hooks_t = executor_hooks<Output>;

    // use make_bounded_executor(), completion callbacks need shared ownership.
    bounded_executor(bounded_opts opts, handler_t handler, hooks_t hooks)
        : m_opts(validate(opts)), m_handler(std::move(handler)), m_hooks(std::move(hooks)) {}

    bounded_executor(const bounded_executor&) = delete;
    bounded_executor& operator=(const bounded_executor&) = delete;

    admission admit(Input input) {
        if (m_stopped || m_draining) {
            return admission::rejected;
        }
        if (has_free_slot() && m_queue.empty()) {
            start(std::move(input));
            return admission::started;
        }
        m_queue.push_back(std::move(input));
        return admission::queued;
    }

    // stops admissions; done gets called once nothing is running or queued. Error is the first
    // failure, or operation_canceled when cancel_all() tore the executor down.
    void drain_and_wait(async_callback<void, LogFns> done) {
        m_draining = true;
        m_drain_waiters.emplace_back(std::move(done));
        notify_if_idle();
    }

    void cancel_all() {
        m_stopped = true;
        m_queue.clear();

        // cancellation may settle synchronously, such settlements find nothing and get discarded.
        auto running = std::exchange(m_running, {});
        for (auto& [id, token] : running) {
            token->cancel();
        }
        m_draining = true;
        notify_if_idle();
    }

    std::size_t running_count() const { return m_running.size(); }
    std::size_t queued_count() const { return m_queue.size(); }
    std::size_t limit() const { return static_cast<std::size_t>(m_opts.concurrency_limit); }
    bool stopped() const { return m_stopped; }

   private:
    using job_id = std::uint64_t;

    bool has_free_slot() const { return m_running.size() < limit(); }

    void start(Input input) {
        const job_id id = m_next_job_id++;
        // the handler may settle synchronously and still touch the token afterwards.
        auto token = std::make_shared<cancellation_token>();
        m_running.emplace(id, token);

        std::weak_ptr<bounded_executor> weak_this = this->shared_from_this();
        settle_callback_t done(
            [weak_this, id](std::error_code ec, Output result) {
                if (auto this_ = weak_this.lock()) {
                    this_->on_settle(id, ec, std::move(result));
                }
            },
            m_opts.name);

        // may settle before returning.
        m_handler(std::move(input), *token, std::move(done));
    }

    void on_settle(job_id id, std::error_code ec, Output result) {
        auto it = m_running.find(id);
        if (it == m_running.end()) {
            if (ec != std::errc::operation_canceled) {
                LogFns::print_warning_line("bounded_flow: {}: discarding outcome of cancelled job #{}: {}",
                                           m_opts.name, id, ec ? ec.message() : std::string("success"));
            }
            return;
        }
        it->second->reset();
        m_running.erase(it);

        if (ec) {
            // first failure, every later settlement belongs to a cancelled job.
            m_stopped = true;
            m_failure = ec;
            if (m_hooks.on_failure) {
                try {
                    m_hooks.on_failure(ec);
                } catch (const std::exception& e) {
                    LogFns::print_error_line("bounded_flow: {}: failure hook threw: {}", m_opts.name, e.what());
                    cancel_all();
                    throw;
                }
            }
            cancel_all();
            return;
        }

        if (m_hooks.on_result) {
            try {
                m_hooks.on_result(std::move(result));
            } catch (const std::exception& e) {
                // the slot is free already, keep the queue moving before reporting.
                LogFns::print_error_line("bounded_flow: {}: result hook threw: {}", m_opts.name, e.what());
                advance();
                notify_if_idle();
                throw;
            }
        }
        advance();
        notify_if_idle();
    }

    void advance() {
        if (m_advancing) {
            // synchronous settlement from inside the loop below, the loop picks it up.
            return;
        }
        struct advancing_guard {
            bool& flag;
            ~advancing_guard() { flag = false; }
        } guard{m_advancing};
        m_advancing = true;

        while (!m_stopped && !m_queue.empty() && has_free_slot()) {
            auto input = std::move(m_queue.front());
            m_queue.pop_front();
            start(std::move(input));
            if (m_stopped) {
                break;
            }
            if (m_hooks.on_dequeued) {
                m_hooks.on_dequeued(m_queue.size());
            }
        }
    }

    void notify_if_idle() {
        if (!m_draining || !m_running.empty() || !m_queue.empty() || m_drain_waiters.empty()) {
            return;
        }
        std::error_code ec;
        if (m_stopped) {
            ec = m_failure ? m_failure : make_error_code(std::errc::operation_canceled);
        }
        auto waiters = std::exchange(m_drain_waiters, {});
        for (auto& done : waiters) {
            done(ec);
        }
    }

    const bounded_opts m_opts;
    handler_t m_handler;
    hooks_t m_hooks;

    std::deque<Input> m_queue;
    std::unordered_map<job_id, std::shared_ptr<cancellation_token>> m_running;
    job_id m_next_job_id = 0;

    bool m_advancing = false;
    bool m_draining = false;
    bool m_stopped = false;
    std::error_code m_failure;
    std::vector<async_callback<void, LogFns>> m_drain_waiters;
};

template <class Input, class Output, class LogFns = details::default_log_fns_t>
std::shared_ptr<bounded_executor<Input, Output, LogFns>> make_bounded_executor(
    bounded_opts opts,
    typename bounded_executor<Input, Output, LogFns>::handler_t handler,
    executor_hooks<Output> hooks = {}) {
    return std::make_shared<bounded_executor<Input, Output, LogFns>>(std::move(opts), std::move(handler),
                                                                     std::move(hooks));
}

}  // namespace bounded_flow
