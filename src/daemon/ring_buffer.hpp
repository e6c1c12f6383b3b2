#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

// Lock-free single-producer single-consumer ring of samples.
// The PipeWire thread writes, the main thread drains. When the ring is full
// new samples are dropped and counted, so the oldest audio is kept.
template <typename T>
class RingBuffer {
    static_assert(std::is_trivially_copyable_v<T>);

public:
    explicit RingBuffer(size_t capacity)
        : buf_(capacity), capacity_(capacity) {}

    // Producer. Returns samples actually stored.
    size_t write(std::span<const T> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t to_write = std::min(samples.size(), capacity_ - (w - r));
        if (to_write < samples.size()) {
            dropped_.fetch_add(samples.size() - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, to_write - first, buf_.begin());

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer. Returns samples actually read into out.
    size_t read(std::span<T> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(out.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, out.begin());
        std::copy_n(buf_.begin(), to_read - first, out.begin() + first);

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    std::vector<T> drain_all() {
        std::vector<T> out(available());
        out.resize(read(out));
        return out;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<T> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
