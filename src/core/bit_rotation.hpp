#pragma once

#include <cstdint>
#include <cstddef>

namespace xorblur {

// Shift amounts are expected in [0, 7]; 0 returns the value unchanged.
inline uint8_t rotateLeft8(uint8_t value, unsigned shift) {
    if (shift == 0) {
        return value;
    }
    return static_cast<uint8_t>((value << shift) | (value >> (8 - shift)));
}

inline uint8_t rotateRight8(uint8_t value, unsigned shift) {
    if (shift == 0) {
        return value;
    }
    return static_cast<uint8_t>((value >> shift) | (value << (8 - shift)));
}

inline unsigned dynamicShift(size_t position, uint8_t shiftMask) {
    return static_cast<unsigned>((position + shiftMask) & 0x7);
}

}
