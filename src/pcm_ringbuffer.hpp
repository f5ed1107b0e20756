#ifndef PCM_RINGBUFFER_HPP
#define PCM_RINGBUFFER_HPP

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace rplayer {

// Single-producer/single-consumer byte queue between the decoder thread
// and the audio device callback. Capacity must be a power of two.
class PcmRingBuffer {
public:
    explicit PcmRingBuffer(size_t capacity = 262144)
        : mask_(capacity - 1), buffer_(capacity, 0) {}

    PcmRingBuffer(const PcmRingBuffer&) = delete;
    PcmRingBuffer& operator=(const PcmRingBuffer&) = delete;

    size_t capacity() const { return buffer_.size(); }

    // Producer side. Returns bytes accepted (less than len when full).
    size_t write(const uint8_t* src, size_t len) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);

        size_t to_write = std::min(len, capacity() - (head - tail) - 1);
        if (to_write == 0) return 0;

        size_t first = std::min(to_write, capacity() - (head & mask_));
        std::memcpy(buffer_.data() + (head & mask_), src, first);
        std::memcpy(buffer_.data(), src + first, to_write - first);

        head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer side. Returns bytes delivered (less than len when empty).
    size_t read(uint8_t* dst, size_t len) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);

        size_t to_read = std::min(len, head - tail);
        if (to_read == 0) return 0;

        size_t first = std::min(to_read, capacity() - (tail & mask_));
        std::memcpy(dst, buffer_.data() + (tail & mask_), first);
        std::memcpy(dst + first, buffer_.data(), to_read - first);

        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    size_t readAvailable() const {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }

    // Drop everything queued (consumer side, before a new stream)
    void clear() {
        tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    size_t mask_;
    std::vector<uint8_t> buffer_;
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

} // namespace rplayer

#endif // PCM_RINGBUFFER_HPP
