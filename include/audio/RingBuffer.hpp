#pragma once
#include <cstddef>
#include <vector>
#include <atomic>
#include <cstring>
#include <algorithm>

// Lock-free single-producer single-consumer sample ring for one channel.
// Producer: stream callback (real-time safe, no allocs, no locks).
// Consumer: AudioEngine::process() on the session's control thread.
// Samples that do not fit are dropped and counted, never blocked on.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity = 8192)
        : buf_(capacity), capacity_(capacity) {}

    // Producer side. Returns the number of samples stored.
    size_t write(const float* data, size_t count) {
        size_t wr = writePos_.load(std::memory_order_relaxed);
        size_t rd = readPos_.load(std::memory_order_acquire);

        size_t toWrite = std::min(count, capacity_ - (wr - rd));
        if (toWrite < count)
            dropped_.fetch_add(count - toWrite, std::memory_order_relaxed);
        if (toWrite == 0) return 0;

        size_t idx   = wr % capacity_;
        size_t first = std::min(toWrite, capacity_ - idx);
        std::memcpy(&buf_[idx], data, first * sizeof(float));
        if (toWrite > first)
            std::memcpy(&buf_[0], data + first, (toWrite - first) * sizeof(float));

        writePos_.store(wr + toWrite, std::memory_order_release);
        return toWrite;
    }

    // Consumer side
    size_t read(float* out, size_t count) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);

        size_t toRead = std::min(count, wr - rd);
        if (toRead == 0) return 0;

        size_t idx   = rd % capacity_;
        size_t first = std::min(toRead, capacity_ - idx);
        std::memcpy(out, &buf_[idx], first * sizeof(float));
        if (toRead > first)
            std::memcpy(out + first, &buf_[0], (toRead - first) * sizeof(float));

        readPos_.store(rd + toRead, std::memory_order_release);
        return toRead;
    }

    // Consumer side: throw samples away without copying them out
    size_t skip(size_t count) {
        size_t rd = readPos_.load(std::memory_order_relaxed);
        size_t wr = writePos_.load(std::memory_order_acquire);
        size_t n  = std::min(count, wr - rd);
        readPos_.store(rd + n, std::memory_order_release);
        return n;
    }

    size_t available() const {
        return writePos_.load(std::memory_order_acquire)
             - readPos_.load(std::memory_order_relaxed);
    }

    size_t capacity() const { return capacity_; }

    // Samples lost to overrun since the last call (consumer side)
    size_t takeDropped() {
        return dropped_.exchange(0, std::memory_order_relaxed);
    }

    // Only safe while the producer is not running
    void reset() {
        writePos_.store(0, std::memory_order_relaxed);
        readPos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
    std::atomic<size_t> dropped_{0};
};
