#include "sstun/wait_group.hpp"

#include <utility>

namespace sstun {

WaitGroup::Token::Token(Token&& other) noexcept : group_(std::exchange(other.group_, nullptr)) {}

WaitGroup::Token::~Token() {
    if (group_)
        group_->done();
}

void WaitGroup::add(size_t n) {
    std::lock_guard<std::mutex> lk(mtx_);
    count_ += n;
}

void WaitGroup::done() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (count_ > 0 && --count_ == 0)
        cv_.notify_all();
}

void WaitGroup::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return count_ == 0; });
}

size_t WaitGroup::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
}

WaitGroup::Token WaitGroup::track() {
    add(1);
    return Token(this);
}

} // namespace sstun
