#pragma once

#include "asio_config.hpp"

#include <asio/experimental/parallel_group.hpp>
#include <chrono>
#include <expected>
#include <system_error>
#include <type_traits>
#include <utility>

namespace sstun {

// Runs `op` (a deferred operation completing with (error_code) or
// (error_code, T)) against a timer on the current executor; whichever ends
// first cancels the other. If the operation completed anyway it wins, so a
// read that raced the timer never loses its bytes. Expiry is reported as
// std::errc::timed_out.
template <typename T = void, typename Op>
auto with_timeout_nothrow(Op op, std::chrono::steady_clock::duration duration)
    -> asio::awaitable<std::expected<T, std::error_code>> {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(duration);

    auto result = co_await asio::experimental::make_parallel_group(std::move(op), timer.async_wait(asio::deferred))
                      .async_wait(asio::experimental::wait_for_one(), asio::use_awaitable);

    const auto& order = std::get<0>(result);
    std::error_code ec = std::get<1>(result);

    if (!ec) {
        if constexpr (!std::is_void_v<T>) {
            co_return std::move(std::get<2>(result));
        } else {
            co_return std::expected<void, std::error_code>{};
        }
    }

    if (order[0] == 1 && ec == asio::error::operation_aborted) {
        co_return std::unexpected(std::make_error_code(std::errc::timed_out));
    }
    co_return std::unexpected(ec);
}

inline bool is_timeout(const std::error_code& ec) {
    return ec == std::errc::timed_out;
}

} // namespace sstun
