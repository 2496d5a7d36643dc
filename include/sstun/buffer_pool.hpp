#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace sstun {

// Free list of equally sized byte buffers. acquire() reuses a free buffer or
// allocates one; a returned buffer is kept only while fewer than max_free are
// held, otherwise it is released to the allocator.
class BufferPool {
  public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 8192;
    static constexpr size_t DEFAULT_MAX_FREE = 2048;

    class Lease {
      public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        uint8_t* data() { return buffer_.data(); }
        size_t size() const { return buffer_.size(); }
        std::span<uint8_t> span() { return buffer_; }

      private:
        friend class BufferPool;
        Lease(BufferPool* pool, std::vector<uint8_t> buffer);

        BufferPool* pool_;
        std::vector<uint8_t> buffer_;
    };

    explicit BufferPool(size_t buffer_size = DEFAULT_BUFFER_SIZE, size_t max_free = DEFAULT_MAX_FREE);

    // Process-wide pool used by the relay.
    static BufferPool& shared();

    Lease acquire();

    size_t buffer_size() const { return buffer_size_; }
    size_t free_count() const;

  private:
    void release(std::vector<uint8_t> buffer);

    const size_t buffer_size_;
    const size_t max_free_;
    mutable std::mutex mtx_;
    std::vector<std::vector<uint8_t>> free_;
};

} // namespace sstun
