#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Lock-free single-producer single-consumer ring of int16 samples.
// Producer (PipeWire RT thread) calls write(). Consumer (event loop) calls
// read()/drain_all(). Neither side allocates or blocks.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. Whatever does not fit is
    // dropped and counted. With `channels` > 1 only whole interleaved frames
    // are written, so an overflow never splits a frame.
    size_t write(const int16_t* data, size_t count, size_t channels = 1) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t free_space = capacity_ - (w - r);
        size_t to_write = std::min(count, free_space);
        if (channels > 1) to_write -= to_write % channels;
        if (to_write < count) {
            dropped_.fetch_add(count - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, data, first * sizeof(int16_t));
        if (first < to_write) {
            std::memcpy(buf_.data(), data + first, (to_write - first) * sizeof(int16_t));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to max_count samples.
    size_t read(int16_t* dest, size_t max_count) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_count, w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dest, buf_.data() + offset, first * sizeof(int16_t));
        if (first < to_read) {
            std::memcpy(dest + first, buf_.data(), (to_read - first) * sizeof(int16_t));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: take everything currently readable, keeping whole frames of
    // `channels` interleaved samples together.
    std::vector<int16_t> drain_all(size_t channels = 1) {
        size_t avail = available();
        if (channels > 1) avail -= avail % channels;
        if (avail == 0) return {};

        std::vector<int16_t> samples(avail);
        read(samples.data(), avail);
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Consumer side only, and only while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
