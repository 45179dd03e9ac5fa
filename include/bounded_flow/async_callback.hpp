#pragma once

#include "bounded_flow/errors.hpp"
#include "bounded_flow/log.hpp"

#include <function2/function2.hpp>

#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace bounded_flow {

namespace details {

template <class T>
struct func_type {
    using async_callback_t = fu2::unique_function<void(std::error_code, T)>;
};

template <>
struct func_type<void> {
    using async_callback_t = fu2::unique_function<void(std::error_code)>;
};

}  // namespace details

// Completion callback that settles exactly once.
//
// A second invocation is ignored. If the callback is destroyed without having been
// invoked, the wrapped callable receives errors::bounded_flow_err::not_called (and a
// default constructed T), so an operation that loses its callback still settles.
template <class T, class LogFns = details::default_log_fns_t>
class async_callback {
   public:
    async_callback() = default;

    template <class Callable,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Callable>, async_callback>>>
    async_callback(Callable cb) : m_cb(std::move(cb)) {}

    template <class Callable>
    async_callback(Callable cb, std::string origin_tag) : m_cb(std::move(cb)), m_origin_tag(std::move(origin_tag)) {}

    ~async_callback() { handle_not_called(); }

    async_callback(const async_callback&) = delete;
    async_callback& operator=(const async_callback&) = delete;

    async_callback(async_callback&& rhs) noexcept
        : m_cb(std::exchange(rhs.m_cb, nullptr)),
          m_called(rhs.m_called),
          m_origin_tag(std::move(rhs.m_origin_tag)) {}

    async_callback& operator=(async_callback&& rhs) noexcept {
        if (this != &rhs) {
            handle_not_called();
            m_cb = std::exchange(rhs.m_cb, nullptr);
            m_called = rhs.m_called;
            m_origin_tag = std::move(rhs.m_origin_tag);
        }
        return *this;
    }

    template <typename EnableWhenVoid = std::enable_if<std::is_same_v<T, void>>,
              typename = typename EnableWhenVoid::type>
    void operator()(const std::error_code& ec) {
        call_operator(ec);
    }

    template <typename Param = T,
              typename EnableWhenNonVoid = std::enable_if<!std::is_same_v<T, void>>,
              typename = typename EnableWhenNonVoid::type>
    void operator()(const std::error_code& ec, Param&& p) {
        call_operator(ec, std::forward<Param>(p));
    }

    // true while a callable is held and has not been invoked yet.
    explicit operator bool() const { return static_cast<bool>(m_cb); }

    bool called() const { return m_called; }

   private:
    template <class... Args>
    void call_operator(Args&&... args) {
        if (m_called) {
            LogFns::print_error_line("bounded_flow: {}: attempt to call the callback twice", m_origin_tag);
            return;
        }
        if (m_cb) {
            m_called = true;
            // the callable may destroy the object owning this callback, keep it on the stack.
            auto cb = std::exchange(m_cb, nullptr);
            std::invoke(cb, std::forward<Args>(args)...);
        }
    }

    void handle_not_called() {
        if (m_cb && !m_called) {
            m_called = true;
            LogFns::print_error_line("bounded_flow: {}: callback has not been called", m_origin_tag);
            auto cb = std::exchange(m_cb, nullptr);
            if constexpr (std::is_void_v<T>) {
                cb(make_error_code(errors::bounded_flow_err::not_called));
            } else {
                cb(make_error_code(errors::bounded_flow_err::not_called), T{});
            }
        }
    }

    typename details::func_type<T>::async_callback_t m_cb;
    bool m_called = false;
    std::string m_origin_tag = "callback";
};

}  // namespace bounded_flow
