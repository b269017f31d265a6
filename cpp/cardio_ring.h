// Fixed-capacity ring buffer with overwrite-oldest semantics
#pragma once

#include <array>
#include <cstddef>

namespace cardio {

template <typename T, std::size_t N>
class RingBuffer {
    static_assert(N > 0, "RingBuffer needs a non-zero capacity");
public:
    // Pushes a value. When full, the oldest value is overwritten and copied
    // to *evicted (if given); returns true in that case.
    bool push(const T& v, T* evicted = nullptr) {
        bool wasFull = full_;
        if (wasFull && evicted) *evicted = buf_[idx_];
        buf_[idx_] = v;
        idx_ = (idx_ + 1) % N;
        if (idx_ == 0) full_ = true;
        return wasFull;
    }

    void clear() { idx_ = 0; full_ = false; }

    std::size_t size() const { return full_ ? N : idx_; }
    bool empty() const { return size() == 0; }
    bool full() const { return full_; }
    static constexpr std::size_t capacity() { return N; }

    // i = 0 is the oldest element, size()-1 the newest
    const T& operator[](std::size_t i) const { return buf_[(start() + i) % N]; }
    T& operator[](std::size_t i) { return buf_[(start() + i) % N]; }

    const T& newest() const { return buf_[(idx_ + N - 1) % N]; }
    const T& oldest() const { return buf_[start()]; }

    // k = 0 is the newest element
    const T& back(std::size_t k) const { return buf_[(idx_ + N - 1 - k) % N]; }

private:
    std::size_t start() const { return full_ ? idx_ : 0; }

    std::array<T, N> buf_{};
    std::size_t idx_ {0};
    bool full_ {false};
};

} // namespace cardio
