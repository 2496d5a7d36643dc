#include "sstun/relay.hpp"

#include "sstun/buffer_pool.hpp"
#include "sstun/log.hpp"
#include "sstun/timeout.hpp"

namespace sstun {

Relay::Relay(const std::atomic<bool>& stopping, std::chrono::steady_clock::duration read_timeout,
             TrafficListener* listener)
    : stopping_(stopping), read_timeout_(read_timeout), listener_(listener) {}

asio::awaitable<void> Relay::run(Stream& source, Stream& destination, Direction direction) const {
    auto buffer = BufferPool::shared().acquire();

    // Unread data is dropped on shutdown.
    while (!stopping_.load(std::memory_order_acquire)) {
        auto read_res = co_await source.read_some(asio::buffer(buffer.data(), buffer.size()), read_timeout_);
        if (!read_res) {
            // The deadline only bounds how long shutdown goes unnoticed.
            if (is_timeout(read_res.error()))
                continue;
            break;
        }

        size_t n = *read_res;
        if (n == 0)
            continue;

        auto write_res = co_await destination.write(asio::buffer(buffer.data(), n));
        if (!write_res) {
            log::debug("write: {}", write_res.error().message());
            break;
        }
        account(direction, *write_res);
    }

    destination.close();
}

void Relay::account(Direction direction, size_t n) const {
    if (!listener_)
        return;
    switch (direction) {
        case Direction::OUTBOUND:
            listener_->sent(n);
            break;
        case Direction::INBOUND:
            listener_->received(n);
            break;
    }
}

} // namespace sstun
