#include "kernel/panic.hpp"
#include "kernel/console.hpp"

Never panic(const char* message)
{
    asm volatile("cli" ::: "memory");
    log("Kernel panic: ", message);
    halt();
}

Never panic(const elib::Error& error)
{
    asm volatile("cli" ::: "memory");
    log("Kernel panic: ", error);
    halt();
}

Never halt()
{
    while (true) {
        asm volatile("cli; hlt" ::: "memory");
    }
}
