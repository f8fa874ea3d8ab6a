/**
 * @file Logger.hpp
 * @brief Lock-free telemetry logger shared by the synthesis core and the playback worker.
 */

#ifndef SOUNDWAVE_LOGGER_HPP
#define SOUNDWAVE_LOGGER_HPP

#include <atomic>
#include <array>
#include <chrono>
#include <optional>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <iostream>

namespace soundwave {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size so that the playback thread never allocates.
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type;
    char tag[32];      // Category or Tag
    double value;      // Numeric value (for Type::Event)
    char message[64];  // Static message (for Type::Message)
    uint64_t timestamp; // steady_clock, microseconds
};

/**
 * @brief A lock-free, single-producer single-consumer RingBuffer.
 */
template<typename T, size_t Size>
class LockFreeRingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    bool push(const T& item) {
        size_t h = head.load(std::memory_order_relaxed);
        size_t t = tail.load(std::memory_order_acquire);

        if (((h + 1) & mask) == t) {
            return false; // Full
        }

        buffer[h] = item;
        head.store((h + 1) & mask, std::memory_order_release);
        return true;
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

private:
    std::array<T, Size> buffer;
    static constexpr size_t mask = Size - 1;
    std::atomic<size_t> head{0};
    std::atomic<size_t> tail{0};
};

/**
 * @brief Singleton logger for score loading and playback telemetry.
 *
 * Producers call log_message()/log_event(); the driver thread drains with
 * pop_entry() or flush(). Only one thread may produce at a time: the
 * score is loaded before playback starts, and the playback worker is the
 * sole producer while it runs.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    void log_message(const char* tag, const char* msg) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_us();
        ring_buffer.push(entry);
    }

    void log_event(const char* tag, double value) {
        LogEntry entry{};
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_us();
        ring_buffer.push(entry);
    }

    std::optional<LogEntry> pop_entry() {
        return ring_buffer.pop();
    }

    /**
     * @brief Drain all pending entries to the given stream.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out = std::clog) {
        size_t count = 0;
        while (auto entry = ring_buffer.pop()) {
            if (entry->type == LogEntry::Type::Message) {
                out << "[" << entry->tag << "] " << entry->message << '\n';
            } else {
                out << "[" << entry->tag << "] " << entry->value << '\n';
            }
            ++count;
        }
        out.flush();
        return count;
    }

private:
    AudioLogger() = default;

    static uint64_t now_us() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer;
};

} // namespace soundwave

#endif // SOUNDWAVE_LOGGER_HPP
