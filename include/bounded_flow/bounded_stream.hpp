#pragma once

#include "bounded_flow/async_callback.hpp"
#include "bounded_flow/bounded_executor.hpp"
#include "bounded_flow/errors.hpp"
#include "bounded_flow/log.hpp"
#include "bounded_flow/options.hpp"

#include <function2/function2.hpp>

#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace bounded_flow {

enum class stream_state {
    open,
    ending,
    closed,
};

// Readable side. Every member is optional.
template <class Output>
struct stream_listener {
    fu2::unique_function<void(Output)> on_data;
    // first failed operation, at most once per stream.
    fu2::unique_function<void(std::error_code)> on_error;
    // graceful drain completed, followed by on_close.
    fu2::unique_function<void()> on_end;
    // exactly once, always last.
    fu2::unique_function<void()> on_close;
    // the pending queue emptied, a producer paused by write() == false may go on.
    fu2::unique_function<void()> on_resume;
};

// Push based duplex on top of bounded_executor.
//
// write() hands inputs to the executor and returns false when the input had to be queued: the
// producer should stop until on_resume (or async_wait_ready). end() finishes gracefully once all
// outstanding work settled, close() cancels it. The first failed operation emits on_error, cancels
// everything else and closes the stream.
template <class Input, class Output, class LogFns = details::default_log_fns_t>
class bounded_stream : public std::enable_shared_from_this<bounded_stream<Input, Output, LogFns>> {
   public:
    using executor_t = bounded_executor<Input, Output, LogFns>;
    using handler_t = typename executor_t::handler_t;
    using listener_t = stream_listener<Output>;

    // use create() / make_bounded_stream().
    bounded_stream(std::string name, listener_t listener) : m_name(std::move(name)), m_listener(std::move(listener)) {}

    ~bounded_stream() {
        if (m_executor) {
            m_executor->cancel_all();
        }
        fail_ready_waiters(make_error_code(errors::bounded_flow_err::stream_closed));
    }

    bounded_stream(const bounded_stream&) = delete;
    bounded_stream& operator=(const bounded_stream&) = delete;

    static std::shared_ptr<bounded_stream> create(bounded_opts opts, handler_t handler, listener_t listener) {
        validate(opts);
        auto stream = std::make_shared<bounded_stream>(opts.name, std::move(listener));

        std::weak_ptr<bounded_stream> weak_stream = stream;
        executor_hooks<Output> hooks;
        hooks.on_result = [weak_stream](Output value) {
            if (auto stream = weak_stream.lock()) {
                stream->handle_data(std::move(value));
            }
        };
        hooks.on_failure = [weak_stream](std::error_code ec) {
            if (auto stream = weak_stream.lock()) {
                stream->handle_failure(ec);
            }
        };
        hooks.on_dequeued = [weak_stream](std::size_t queued_left) {
            if (auto stream = weak_stream.lock()) {
                stream->handle_dequeued(queued_left);
            }
        };
        stream->m_executor =
            make_bounded_executor<Input, Output, LogFns>(std::move(opts), std::move(handler), std::move(hooks));
        return stream;
    }

    // true: go on writing, false: the input got queued, wait for resume. Writes to a stream that
    // is no longer open are dropped and return false.
    bool write(Input input) {
        if (m_state != stream_state::open) {
            LogFns::print_warning_line("bounded_flow: {}: write after end, input dropped", m_name);
            return false;
        }
        return m_executor->admit(std::move(input)) == admission::started;
    }

    void end() {
        if (m_state != stream_state::open) {
            return;
        }
        m_state = stream_state::ending;
        fail_ready_waiters(make_error_code(errors::bounded_flow_err::write_after_end));

        std::weak_ptr<bounded_stream> weak_this = this->shared_from_this();
        m_executor->drain_and_wait(async_callback<void, LogFns>(
            [weak_this](std::error_code ec) {
                // failures and close() have already finished the stream.
                if (ec) {
                    return;
                }
                if (auto this_ = weak_this.lock()) {
                    this_->finish();
                }
            },
            m_name));
    }

    void end(Input input) {
        if (m_state != stream_state::open) {
            return;
        }
        write(std::move(input));
        end();
    }

    void close() {
        if (m_state == stream_state::closed) {
            return;
        }
        auto self = this->shared_from_this();
        m_state = stream_state::closed;
        m_executor->cancel_all();
        fail_ready_waiters(make_error_code(errors::bounded_flow_err::stream_closed));
        emit_close();
    }

    // explicit form of the resume signal: done({}) as soon as a write would not find a pending
    // queue. Fails with stream_closed or write_after_end when nothing may be written anymore.
    void async_wait_ready(async_callback<void, LogFns> done) {
        if (m_state == stream_state::closed) {
            done(make_error_code(errors::bounded_flow_err::stream_closed));
            return;
        }
        if (m_state == stream_state::ending) {
            done(make_error_code(errors::bounded_flow_err::write_after_end));
            return;
        }
        if (m_executor->queued_count() == 0) {
            done(std::error_code());
            return;
        }
        m_ready_waiters.emplace_back(std::move(done));
    }

    stream_state state() const { return m_state; }
    std::size_t running_count() const { return m_executor->running_count(); }
    std::size_t queued_count() const { return m_executor->queued_count(); }

   private:
    void handle_data(Output value) {
        if (m_state == stream_state::closed) {
            return;
        }
        if (m_listener.on_data) {
            m_listener.on_data(std::move(value));
        }
    }

    void handle_failure(std::error_code ec) {
        if (m_state == stream_state::closed) {
            return;
        }
        auto self = this->shared_from_this();
        m_state = stream_state::closed;
        if (m_listener.on_error) {
            m_listener.on_error(ec);
        }
        m_executor->cancel_all();
        fail_ready_waiters(make_error_code(errors::bounded_flow_err::stream_closed));
        emit_close();
    }

    void handle_dequeued(std::size_t queued_left) {
        if (queued_left != 0 || m_state != stream_state::open) {
            return;
        }
        if (m_listener.on_resume) {
            m_listener.on_resume();
        }
        auto waiters = std::exchange(m_ready_waiters, {});
        for (auto& done : waiters) {
            done(std::error_code());
        }
    }

    void finish() {
        if (m_state != stream_state::ending) {
            return;
        }
        auto self = this->shared_from_this();
        m_state = stream_state::closed;
        if (m_listener.on_end) {
            m_listener.on_end();
        }
        emit_close();
    }

    void emit_close() {
        if (m_listener.on_close) {
            std::exchange(m_listener.on_close, nullptr)();
        }
    }

    void fail_ready_waiters(std::error_code ec) {
        auto waiters = std::exchange(m_ready_waiters, {});
        for (auto& done : waiters) {
            done(ec);
        }
    }

    const std::string m_name;
    listener_t m_listener;
    std::shared_ptr<executor_t> m_executor;
    stream_state m_state = stream_state::open;
    std::vector<async_callback<void, LogFns>> m_ready_waiters;
};

template <class Input, class Output, class LogFns = details::default_log_fns_t>
std::shared_ptr<bounded_stream<Input, Output, LogFns>> make_bounded_stream(
    bounded_opts opts,
    typename bounded_stream<Input, Output, LogFns>::handler_t handler,
    stream_listener<Output> listener) {
    return bounded_stream<Input, Output, LogFns>::create(std::move(opts), std::move(handler), std::move(listener));
}

}  // namespace bounded_flow
