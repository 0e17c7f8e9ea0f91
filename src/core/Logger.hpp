/**
 * @file Logger.hpp
 * @brief Real-time safe telemetry logger shared by the render and control threads.
 */

#ifndef TONEGEN_LOGGER_HPP
#define TONEGEN_LOGGER_HPP

#include <atomic>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>

namespace tonegen {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};     // Category or Tag
    float value = 0.0f;    // Numeric value (for Type::Event)
    char message[64] = {}; // Static message (for Type::Message)
    uint64_t timestamp = 0; // Microseconds since the logger was created
};

/**
 * @brief A lock-free ring buffer with a single consumer.
 *
 * Producers (render thread, control threads) serialize on a flag held only for one
 * slot copy. A producer that finds the flag taken drops its entry instead of
 * waiting, the same as when the buffer is full.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    /**
     * @return false if the entry was dropped (buffer full or another producer busy).
     */
    bool push(const T& item) {
        if (producer_flag.test_and_set(std::memory_order_acquire)) {
            return false;
        }

        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        bool pushed = false;
        if (((h + 1) & mask) != t) {
            buffer[h] = item;
            head.store((h + 1) & mask, std::memory_order_release);
            pushed = true;
        }

        producer_flag.clear(std::memory_order_release);
        return pushed;
    }

    std::optional<T> pop() {
        size_t t = tail.load(std::memory_order_relaxed);
        size_t h = head.load(std::memory_order_acquire);

        if (t == h) {
            return std::nullopt; // Empty
        }

        T item = buffer[t];
        tail.store((t + 1) & mask, std::memory_order_release);
        return item;
    }

    bool empty() const {
        return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
    }

protected:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
    std::atomic_flag producer_flag = ATOMIC_FLAG_INIT;
};

/**
 * @brief Singleton Logger for engine telemetry.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Producer Methods (RT-Safe). Return false if the entry was dropped.
    bool log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        return ring_buffer.push(entry);
    }

    bool log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        return ring_buffer.push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain every pending entry into a stream, one line per entry.
     *
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
            out << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << '\n';
            ++count;
        }
        out.flush();
        return count;
    }

private:
    AudioLogger() : epoch_(std::chrono::steady_clock::now()) {}

    uint64_t now_us() const {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - epoch_).count());
    }

    std::chrono::steady_clock::time_point epoch_;
    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
};

} // namespace tonegen

#endif // TONEGEN_LOGGER_HPP
