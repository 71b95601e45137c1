#pragma once

#include "core/bit_rotation.hpp"

#include <cstdint>
#include <cstddef>
#include <string>

namespace xorblur {

enum class TransformMode {
    Fixed,
    Dynamic
};

std::string toString(TransformMode mode);

constexpr uint64_t DEFAULT_SECRET_KEY = 0x5A7B9C1D3E8F0A2BULL;
constexpr uint8_t DEFAULT_KEY_SEGMENT = static_cast<uint8_t>((DEFAULT_SECRET_KEY >> 16) & 0xFF);
constexpr uint8_t DEFAULT_SIMPLE_KEY = 0xAB;
constexpr int DEFAULT_SHIFT_VALUE = 3;

// Immutable; fixed mode keeps k2 at zero.
class KeyMaterial {
public:
    static KeyMaterial dynamic(uint64_t secretKey, uint8_t keySegment);
    static KeyMaterial fixed(uint8_t key, int shift);
    static KeyMaterial fromSecretKey(uint64_t secretKey, int shiftParam, TransformMode mode);

    TransformMode mode() const { return mode_; }
    bool isDynamic() const { return mode_ == TransformMode::Dynamic; }

    uint8_t keyPart1() const { return keyPart1_; }
    uint8_t keyPart2() const { return keyPart2_; }
    uint8_t shiftMask() const { return shiftMask_; }
    uint8_t fixedShift() const { return fixedShift_; }

    unsigned shiftAt(size_t position) const {
        return mode_ == TransformMode::Dynamic ? dynamicShift(position, shiftMask_) : fixedShift_;
    }

    uint8_t forwardByte(uint8_t value, size_t position) const {
        return static_cast<uint8_t>(rotateLeft8(static_cast<uint8_t>(value ^ keyPart1_), shiftAt(position)) ^ keyPart2_);
    }

    uint8_t inverseByte(uint8_t value, size_t position) const {
        return static_cast<uint8_t>(rotateRight8(static_cast<uint8_t>(value ^ keyPart2_), shiftAt(position)) ^ keyPart1_);
    }

    bool operator==(const KeyMaterial& other) const;
    bool operator!=(const KeyMaterial& other) const { return !(*this == other); }

private:
    KeyMaterial(TransformMode mode, uint8_t keyPart1, uint8_t keyPart2,
                uint8_t shiftMask, uint8_t fixedShift);

    TransformMode mode_;
    uint8_t keyPart1_;
    uint8_t keyPart2_;
    uint8_t shiftMask_;
    uint8_t fixedShift_;
};

}
