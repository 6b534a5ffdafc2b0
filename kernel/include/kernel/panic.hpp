#pragma once

#include <libe/error.hpp>

// Result type of paths that never return. It cannot be constructed, so a function
// returning Never can only end by calling another such function.
struct Never {
    Never() = delete;
};

[[noreturn]] Never panic(const char* message);

[[noreturn]] Never panic(const elib::Error& error);

// Stop the processor for good without printing anything.
[[noreturn]] Never halt();
