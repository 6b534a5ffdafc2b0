#include <cstddef>
#include <cstdint>
#include "kernel/panic.hpp"

// Symbols the compiler may emit calls to even in a freestanding build.

extern "C" void* memcpy(void* destination, const void* source, std::size_t count)
{
    auto d = static_cast<unsigned char*>(destination);
    auto s = static_cast<const unsigned char*>(source);
    for (auto i = std::size_t(0); i < count; i++) {
        d[i] = s[i];
    }
    return destination;
}

extern "C" void* memmove(void* destination, const void* source, std::size_t count)
{
    auto d = static_cast<unsigned char*>(destination);
    auto s = static_cast<const unsigned char*>(source);
    if (d < s) {
        for (auto i = std::size_t(0); i < count; i++) {
            d[i] = s[i];
        }
    } else {
        for (auto i = count; i > 0; i--) {
            d[i - 1] = s[i - 1];
        }
    }
    return destination;
}

extern "C" void* memset(void* destination, int value, std::size_t count)
{
    auto d = static_cast<unsigned char*>(destination);
    for (auto i = std::size_t(0); i < count; i++) {
        d[i] = static_cast<unsigned char>(value);
    }
    return destination;
}

extern "C" int memcmp(const void* lhs, const void* rhs, std::size_t count)
{
    auto l = static_cast<const unsigned char*>(lhs);
    auto r = static_cast<const unsigned char*>(rhs);
    for (auto i = std::size_t(0); i < count; i++) {
        if (l[i] != r[i]) {
            return l[i] < r[i] ? -1 : 1;
        }
    }
    return 0;
}

extern "C" std::size_t strlen(const char* text)
{
    auto length = std::size_t(0);
    while (text[length] != '\0') {
        length++;
    }
    return length;
}

extern "C" void __cxa_pure_virtual()
{
    panic("Pure virtual function called");
}
