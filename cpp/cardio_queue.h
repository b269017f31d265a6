// Bounded hand-off from the sampling task to slower consumers
// (display, storage, reporting). The producer never blocks: when the queue is
// full the oldest unread element is dropped.
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace cardio {

template <typename T, std::size_t N>
class DropOldestQueue {
    static_assert(N > 0, "DropOldestQueue needs a non-zero capacity");
public:
    // Returns false when an unread element had to be dropped
    bool push(const T& v) {
        std::lock_guard<std::mutex> lock(m_);
        bool dropped = (count_ == N);
        if (dropped) {
            head_ = (head_ + 1) % N;
            --count_;
            ++dropped_;
        }
        buf_[(head_ + count_) % N] = v;
        ++count_;
        return !dropped;
    }

    // Non-blocking; returns false when empty
    bool pop(T& out) {
        std::lock_guard<std::mutex> lock(m_);
        if (count_ == 0) return false;
        out = buf_[head_];
        head_ = (head_ + 1) % N;
        --count_;
        return true;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return count_;
    }
    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(m_);
        return dropped_;
    }
    static constexpr std::size_t capacity() { return N; }

private:
    mutable std::mutex m_;
    std::array<T, N> buf_{};
    std::size_t head_ {0};
    std::size_t count_ {0};
    std::uint64_t dropped_ {0};
};

} // namespace cardio
