#pragma once

#include "bounded_flow/async_callback.hpp"
#include "bounded_flow/bounded_stream.hpp"
#include "bounded_flow/errors.hpp"
#include "bounded_flow/log.hpp"

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <memory>
#include <optional>
#include <system_error>
#include <utility>

namespace bounded_flow {

namespace details {

template <class Input, class Output, class LogFns, class Source>
class pump_state : public std::enable_shared_from_this<pump_state<Input, Output, LogFns, Source>> {
   public:
    using stream_ptr = std::shared_ptr<bounded_stream<Input, Output, LogFns>>;

    pump_state(asio::io_context& ctx, Source source, stream_ptr stream, async_callback<void, LogFns> done)
        : m_ctx(ctx), m_source(std::move(source)), m_stream(std::move(stream)), m_done(std::move(done)) {}

    void read_next() {
        // posted, so that sources completing synchronously do not grow the stack.
        asio::post(m_ctx, [self = this->shared_from_this()] {
            if (self->m_stream->state() != stream_state::open) {
                self->m_done(make_error_code(errors::bounded_flow_err::stream_closed));
                return;
            }
            self->m_source(async_callback<std::optional<Input>, LogFns>(
                [self](std::error_code ec, std::optional<Input> item) { self->on_item(ec, std::move(item)); },
                "async_pump"));
        });
    }

   private:
    void on_item(std::error_code ec, std::optional<Input> item) {
        if (ec) {
            m_stream->close();
            m_done(ec);
            return;
        }
        if (m_stream->state() != stream_state::open) {
            m_done(make_error_code(errors::bounded_flow_err::stream_closed));
            return;
        }
        if (!item) {
            m_stream->end();
            m_done(std::error_code());
            return;
        }
        if (m_stream->write(std::move(*item))) {
            read_next();
            return;
        }
        m_stream->async_wait_ready(async_callback<void, LogFns>(
            [self = this->shared_from_this()](std::error_code ec) {
                if (ec) {
                    self->m_done(ec);
                    return;
                }
                self->read_next();
            },
            "async_pump"));
    }

    asio::io_context& m_ctx;
    Source m_source;
    stream_ptr m_stream;
    async_callback<void, LogFns> m_done;
};

}  // namespace details

// Feeds a stream from a pull based source until the source runs dry, honouring backpressure.
//
// source: void(async_callback<std::optional<Input>>), delivers std::nullopt at the end of input.
// done: void(std::error_code), {} once the source is exhausted and stream->end() was called (the stream reports its own
// completion through its listener), the source's error (the stream gets closed), or stream_closed
// when the stream finished before the source did.
template <class Input, class Output, class LogFns, class Source, class Done>
void async_pump(asio::io_context& ctx,
                Source source,
                std::shared_ptr<bounded_stream<Input, Output, LogFns>> stream,
                Done done) {
    auto state = std::make_shared<details::pump_state<Input, Output, LogFns, Source>>(
        ctx, std::move(source), std::move(stream), async_callback<void, LogFns>(std::move(done), "async_pump"));
    state->read_next();
}

}  // namespace bounded_flow
