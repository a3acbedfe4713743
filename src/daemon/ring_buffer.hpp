#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of F32 samples.
// Producer (PipeWire process callback) calls push(). Consumer (audio worker) calls drain().
// Samples that do not fit are dropped and counted rather than overwriting older audio.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns the number of samples stored.
    size_t push(std::span<const float> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t space = capacity_ - (w - r);
        size_t n = std::min(samples.size(), space);
        dropped_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        if (n == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, n - first, buf_.begin());

        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer: take everything currently buffered.
    std::vector<float> drain() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t n = w - r;
        if (n == 0) return {};

        std::vector<float> out(n);
        size_t offset = r % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, out.begin());
        std::copy_n(buf_.begin(), n - first, out.begin() + first);

        read_pos_.store(r + n, std::memory_order_release);
        return out;
    }

    size_t size() const {
        return write_pos_.load(std::memory_order_acquire) - read_pos_.load(std::memory_order_acquire);
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only valid while the producer is stopped.
    void clear() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
