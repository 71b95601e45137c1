#include "key_material.hpp"

namespace xorblur {

std::string toString(TransformMode mode) {
    return mode == TransformMode::Dynamic ? "dynamic" : "fixed";
}

KeyMaterial::KeyMaterial(TransformMode mode, uint8_t keyPart1, uint8_t keyPart2,
                         uint8_t shiftMask, uint8_t fixedShift)
    : mode_(mode), keyPart1_(keyPart1), keyPart2_(keyPart2),
      shiftMask_(shiftMask), fixedShift_(fixedShift) {}

KeyMaterial KeyMaterial::dynamic(uint64_t secretKey, uint8_t keySegment) {
    return KeyMaterial(TransformMode::Dynamic,
                       static_cast<uint8_t>(secretKey & 0xFF),
                       static_cast<uint8_t>((secretKey >> 8) & 0xFF),
                       keySegment, 0);
}

KeyMaterial KeyMaterial::fixed(uint8_t key, int shift) {
    return KeyMaterial(TransformMode::Fixed, key, 0, 0, static_cast<uint8_t>(shift & 0x7));
}

KeyMaterial KeyMaterial::fromSecretKey(uint64_t secretKey, int shiftParam, TransformMode mode) {
    if (mode == TransformMode::Dynamic) {
        return dynamic(secretKey, static_cast<uint8_t>(shiftParam & 0xFF));
    }
    return fixed(static_cast<uint8_t>(secretKey & 0xFF), shiftParam);
}

bool KeyMaterial::operator==(const KeyMaterial& other) const {
    return mode_ == other.mode_ &&
           keyPart1_ == other.keyPart1_ &&
           keyPart2_ == other.keyPart2_ &&
           shiftMask_ == other.shiftMask_ &&
           fixedShift_ == other.fixedShift_;
}

}
