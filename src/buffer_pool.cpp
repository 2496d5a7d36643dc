#include "sstun/buffer_pool.hpp"

#include <utility>

namespace sstun {

BufferPool::Lease::Lease(BufferPool* pool, std::vector<uint8_t> buffer) : pool_(pool), buffer_(std::move(buffer)) {}

BufferPool::Lease::Lease(Lease&& other) noexcept : pool_(std::exchange(other.pool_, nullptr)), buffer_(std::move(other.buffer_)) {}

BufferPool::Lease& BufferPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        if (pool_)
            pool_->release(std::move(buffer_));
        pool_ = std::exchange(other.pool_, nullptr);
        buffer_ = std::move(other.buffer_);
    }
    return *this;
}

BufferPool::Lease::~Lease() {
    if (pool_)
        pool_->release(std::move(buffer_));
}

BufferPool::BufferPool(size_t buffer_size, size_t max_free) : buffer_size_(buffer_size), max_free_(max_free) {}

BufferPool& BufferPool::shared() {
    static BufferPool instance;
    return instance;
}

BufferPool::Lease BufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!free_.empty()) {
            std::vector<uint8_t> buffer = std::move(free_.back());
            free_.pop_back();
            return Lease(this, std::move(buffer));
        }
    }
    return Lease(this, std::vector<uint8_t>(buffer_size_));
}

size_t BufferPool::free_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return free_.size();
}

void BufferPool::release(std::vector<uint8_t> buffer) {
    if (buffer.size() != buffer_size_)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    if (free_.size() < max_free_)
        free_.push_back(std::move(buffer));
}

} // namespace sstun
