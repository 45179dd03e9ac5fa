#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "bounded_flow/async_pump.hpp"
#include "bounded_flow/bounded_stream.hpp"
#include "bounded_flow/with_timeout.hpp"

using namespace std::chrono_literals;
using namespace bounded_flow;

template <typename Callback>
auto async_sleep(asio::io_context& ctx, std::chrono::steady_clock::duration t, Callback&& cb) {
    auto timer = std::make_shared<asio::steady_timer>(ctx, t);
    timer->async_wait([timer, cb = std::forward<Callback>(cb)](std::error_code ec) mutable { cb(ec); });
    return timer;
}

// usage: bounded_flow_playground [concurrency] [timeout_ms] < lines.txt
// every line is "sent" to a fake remote service answering after a random delay.
int main(int argc, char** argv) {
    bounded_opts opts;
    opts.name = "playground";
    opts.concurrency_limit = argc > 1 ? std::atoi(argv[1]) : 4;
    const auto timeout = std::chrono::milliseconds(argc > 2 ? std::atoi(argv[2]) : 250);

    asio::io_context ctx;

    auto remote_call = [&ctx](std::string line, cancellation_token& token, async_callback<std::string> done) {
        auto latency = std::chrono::milliseconds(std::rand() % 300);
        auto timer = async_sleep(ctx, latency, [line, latency, done = std::move(done)](std::error_code ec) mutable {
            done(ec, fmt::format("{} ({}ms)", line, latency.count()));
        });
        token.impl = [timer] { timer->cancel(); };
    };

    bool failed = false;
    stream_listener<std::string> listener;
    listener.on_data = [](std::string reply) { std::cout << "reply: " << reply << "\n"; };
    listener.on_error = [&failed](std::error_code ec) {
        failed = true;
        std::cout << "failed: " << ec.message() << "\n";
    };
    listener.on_end = [] { std::cout << "all lines processed\n"; };
    listener.on_close = [] { std::cout << "closed\n"; };

    std::shared_ptr<bounded_stream<std::string, std::string>> stream;
    try {
        stream = make_bounded_stream<std::string, std::string>(
            opts, with_timeout<std::string, std::string>(ctx, std::move(remote_call), timeout), std::move(listener));
    } catch (const config_error& e) {
        std::cerr << "invalid configuration: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    auto read_line = [](async_callback<std::optional<std::string>> done) {
        std::string line;
        if (std::getline(std::cin, line)) {
            done(std::error_code(), std::optional<std::string>(std::move(line)));
        } else if (std::cin.eof()) {
            done(std::error_code(), std::nullopt);
        } else {
            done(make_error_code(std::errc::io_error), std::nullopt);
        }
    };

    async_pump(ctx, read_line, stream, [](std::error_code ec) {
        if (ec) {
            std::cerr << "input stopped: " << ec.message() << "\n";
        }
    });

    ctx.run();
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
