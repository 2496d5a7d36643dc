#pragma once

#include "asio_config.hpp"
#include "sstun/stream.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace sstun {

enum class Direction {
    OUTBOUND, // client -> remote
    INBOUND   // remote -> client
};

// Told about every chunk the relay delivers. Called from several relays at
// once; implementations synchronise themselves.
class TrafficListener {
  public:
    virtual ~TrafficListener() = default;
    virtual void sent(size_t n) = 0;
    virtual void received(size_t n) = 0;
};

class Relay {
  public:
    Relay(const std::atomic<bool>& stopping, std::chrono::steady_clock::duration read_timeout,
          TrafficListener* listener = nullptr);

    // Copies source to destination until EOF, an error or shutdown, then
    // closes destination. source is left to the relay running the other way.
    asio::awaitable<void> run(Stream& source, Stream& destination, Direction direction) const;

  private:
    void account(Direction direction, size_t n) const;

    const std::atomic<bool>& stopping_;
    std::chrono::steady_clock::duration read_timeout_;
    TrafficListener* listener_;
};

} // namespace sstun
