#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace elib {

// Lock-free ring for exactly one writer and one reader, e.g. an interrupt handler feeding
// the idle loop. Neither side ever waits; push reports a full ring instead.
template<typename T, std::size_t Capacity>
class SpscRing {
public:
    static_assert(Capacity > 0);

    bool push(const T& value) {
        auto write = writeIndex.load(std::memory_order_relaxed);
        auto after = advance(write);
        if (after == readIndex.load(std::memory_order_acquire)) {
            return false;
        }
        slots[write] = value;
        writeIndex.store(after, std::memory_order_release);
        return true;
    }

    std::optional<T> pop() {
        auto read = readIndex.load(std::memory_order_relaxed);
        if (read == writeIndex.load(std::memory_order_acquire)) {
            return {};
        }
        auto value = slots[read];
        readIndex.store(advance(read), std::memory_order_release);
        return value;
    }

    // Copies everything currently queued to out and returns the end of the copied range.
    T* drain(T* out) {
        auto read  = readIndex.load(std::memory_order_relaxed);
        auto write = writeIndex.load(std::memory_order_acquire);
        for (; read != write; read = advance(read)) {
            *out++ = slots[read];
        }
        readIndex.store(read, std::memory_order_release);
        return out;
    }

    bool empty() const {
        return readIndex.load(std::memory_order_acquire) == writeIndex.load(std::memory_order_acquire);
    }

private:
    // One slot stays unused to tell a full ring from an empty one.
    static constexpr auto SlotCount = Capacity + 1;

    static constexpr std::size_t advance(std::size_t index) {
        return index + 1 == SlotCount ? 0 : index + 1;
    }

    T                        slots[SlotCount];
    std::atomic<std::size_t> readIndex  = 0;
    std::atomic<std::size_t> writeIndex = 0;
};

} // namespace elib
