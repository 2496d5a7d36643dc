#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace sstun {

// Counts outstanding units of work; wait() blocks until the count is zero.
class WaitGroup {
  public:
    // Marks one unit done when destroyed. Move-only, so it can travel into a
    // coroutine frame and fire whether or not the coroutine ever runs.
    class Token {
      public:
        Token(Token&& other) noexcept;
        Token& operator=(Token&&) = delete;
        Token(const Token&) = delete;
        Token& operator=(const Token&) = delete;
        ~Token();

      private:
        friend class WaitGroup;
        explicit Token(WaitGroup* group) : group_(group) {}

        WaitGroup* group_;
    };

    void add(size_t n = 1);
    void done();
    void wait();
    size_t pending() const;

    // add(1) and hand back the matching done().
    Token track();

  private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    size_t count_ = 0;
};

} // namespace sstun
