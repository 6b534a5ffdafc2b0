#include <cstddef>
#include <cstdint>
#include "kernel/kernel.hpp"
#include "kernel/panic.hpp"

// Entered from boot.S in long mode with interrupts disabled, running on the boot stack.
extern "C" [[noreturn]] void kernelMain(std::uint32_t magic, const std::byte* information)
{
    auto kernel = Kernel::make(magic, information);
    if (!kernel) {
        panic(kernel.error());
    }

    (*kernel)->run();
}
