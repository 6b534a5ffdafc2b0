#pragma once

#include <cstdint>
#include <utility>

// Disables interrupts for its lifetime and restores the previous interrupt flag afterwards.
class InterruptGuard {
public:
    InterruptGuard() : enabled(saveAndDisable()) {}

    ~InterruptGuard() {
        if (enabled) {
            asm volatile("sti" ::: "memory");
        }
    }

    InterruptGuard(const InterruptGuard&) = delete;

    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    static bool saveAndDisable() {
        std::uint64_t rflags;
        asm volatile("pushfq; popq %0; cli" : "=r"(rflags) : : "memory");
        return rflags & (std::uint64_t(1) << 9);
    }

    bool enabled;
};

// Owns state shared with interrupt handlers. Access is only handed out with interrupts disabled.
template<typename T>
class IrqLocked {
public:
    class Access {
    public:
        T& operator*() const {
            return *value;
        }

        T* operator->() const {
            return value;
        }

    private:
        friend class IrqLocked;

        explicit Access(T& value) : value(&value) {}

        InterruptGuard guard;
        T*             value;
    };

    template<typename... Args>
    explicit IrqLocked(Args&&... args) : value(std::forward<Args>(args)...) {}

    IrqLocked(const IrqLocked&) = delete;

    IrqLocked& operator=(const IrqLocked&) = delete;

    Access lock() {
        return Access(value);
    }

private:
    T value;
};
