#include "sstun/negotiator.hpp"

#include "sstun/protocol.hpp"
#include "sstun/timeout.hpp"

#include <algorithm>
#include <array>
#include <span>

namespace sstun {

namespace {

// Reads one message into `buf`: at least `min_read` bytes, then exactly up to
// the length `length_of` computes from what arrived. Bytes beyond that length
// belong to nobody and fail the message with EXTRA_DATA.
template <typename LengthFn>
asio::awaitable<std::expected<size_t, std::error_code>> read_message(asio::ip::tcp::socket& socket,
                                                                     std::span<uint8_t> buf, size_t min_read,
                                                                     LengthFn length_of, const ReadLimits& limits) {
    auto deadline = std::chrono::steady_clock::now() + limits.timeout;
    size_t n = 0;
    size_t want = min_read;
    bool sized = false;

    while (true) {
        if (n >= want) {
            if (sized)
                co_return want;

            auto len = length_of(std::span<const uint8_t>(buf.data(), n));
            if (!len)
                co_return std::unexpected(len.error());
            if (n > *len)
                co_return std::unexpected(make_error_code(Error::EXTRA_DATA));
            want = *len;
            sized = true;
            continue;
        }

        if (limits.stopping && limits.stopping->load(std::memory_order_acquire))
            co_return std::unexpected(std::make_error_code(std::errc::operation_canceled));

        auto left = deadline - std::chrono::steady_clock::now();
        if (left <= std::chrono::steady_clock::duration::zero())
            co_return std::unexpected(std::make_error_code(std::errc::timed_out));

        // Until the length is known anything up to the buffer may arrive;
        // afterwards only the remainder is read.
        size_t room = sized ? want - n : buf.size() - n;
        auto got = co_await with_timeout_nothrow<size_t>(
            socket.async_read_some(asio::buffer(buf.data() + n, room), asio::deferred), std::min(left, limits.poll));
        if (!got) {
            if (is_timeout(got.error()))
                continue;
            co_return std::unexpected(got.error());
        }
        n += *got;
    }
}

} // namespace

asio::awaitable<std::expected<void, std::error_code>> negotiate(asio::ip::tcp::socket& socket, ReadLimits limits) {
    // One spare byte so that a message longer than any valid one is still seen as extra data.
    std::array<uint8_t, MAX_HANDSHAKE_LEN + 1> buf;
    auto len = co_await read_message(socket, buf, HANDSHAKE_MIN_READ, handshake_length, limits);
    if (!len)
        co_return std::unexpected(len.error());

    auto [ec, n] = co_await asio::async_write(socket, asio::buffer(NO_AUTH_REPLY), asio::as_tuple(asio::use_awaitable));
    if (ec)
        co_return std::unexpected(ec);
    co_return std::expected<void, std::error_code>{};
}

asio::awaitable<std::expected<ConnectRequest, std::error_code>> read_request(asio::ip::tcp::socket& socket,
                                                                             ReadLimits limits, bool decode_host) {
    std::array<uint8_t, MAX_REQUEST_LEN + 1> buf;
    auto len = co_await read_message(socket, buf, REQUEST_MIN_READ, request_length, limits);
    if (!len)
        co_return std::unexpected(len.error());

    ConnectRequest request;
    request.raw_address.assign(buf.begin() + REQ_ADDRESS_TYPE, buf.begin() + *len);
    if (decode_host)
        request.host = describe_address(request.raw_address);
    co_return request;
}

} // namespace sstun
