#pragma once

#include <cstddef>
#include <string>

#include <sodium.h>

namespace pd {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

inline void secureWipe(std::string& value) {
    secureZero(&value[0], value.size());
    value.clear();
}

// Constant-time comparison of equally sized buffers.
inline bool constantTimeEquals(const void* a, const void* b, std::size_t numBytes) {
    return sodium_memcmp(a, b, numBytes) == 0;
}

} // namespace pd
