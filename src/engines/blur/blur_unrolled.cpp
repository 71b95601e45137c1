#include "blur_unrolled.hpp"

namespace xorblur {

namespace {

inline uint8_t forwardStep(uint8_t b, uint8_t k1, uint8_t k2, unsigned shift) {
    return static_cast<uint8_t>(rotateLeft8(static_cast<uint8_t>(b ^ k1), shift) ^ k2);
}

inline uint8_t inverseStep(uint8_t b, uint8_t k1, uint8_t k2, unsigned shift) {
    return static_cast<uint8_t>(rotateRight8(static_cast<uint8_t>(b ^ k2), shift) ^ k1);
}

}

BlurUnrolledEngine::BlurUnrolledEngine(const KeyMaterial& key, bool parallel)
    : ChunkedBlurEngine(key, CHUNK_THRESHOLD, parallel) {}

void BlurUnrolledEngine::encryptRange(const uint8_t* input, uint8_t* output,
                                      size_t begin, size_t end) const {
    if (key_.isDynamic()) {
        encryptDynamic(input, output, begin, end);
    } else {
        encryptFixed(input, output, begin, end);
    }
}

void BlurUnrolledEngine::decryptRange(const uint8_t* input, uint8_t* output,
                                      size_t begin, size_t end) const {
    if (key_.isDynamic()) {
        decryptDynamic(input, output, begin, end);
    } else {
        decryptFixed(input, output, begin, end);
    }
}

void BlurUnrolledEngine::encryptDynamic(const uint8_t* input, uint8_t* output,
                                        size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();
    const uint8_t mask = key_.shiftMask();

    size_t i = begin;
    for (; i + 4 <= end; i += 4) {
        output[i]     = forwardStep(input[i],     k1, k2, dynamicShift(i, mask));
        output[i + 1] = forwardStep(input[i + 1], k1, k2, dynamicShift(i + 1, mask));
        output[i + 2] = forwardStep(input[i + 2], k1, k2, dynamicShift(i + 2, mask));
        output[i + 3] = forwardStep(input[i + 3], k1, k2, dynamicShift(i + 3, mask));
    }
    for (; i < end; ++i) {
        output[i] = forwardStep(input[i], k1, k2, dynamicShift(i, mask));
    }
}

void BlurUnrolledEngine::decryptDynamic(const uint8_t* input, uint8_t* output,
                                        size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();
    const uint8_t mask = key_.shiftMask();

    size_t i = begin;
    for (; i + 4 <= end; i += 4) {
        output[i]     = inverseStep(input[i],     k1, k2, dynamicShift(i, mask));
        output[i + 1] = inverseStep(input[i + 1], k1, k2, dynamicShift(i + 1, mask));
        output[i + 2] = inverseStep(input[i + 2], k1, k2, dynamicShift(i + 2, mask));
        output[i + 3] = inverseStep(input[i + 3], k1, k2, dynamicShift(i + 3, mask));
    }
    for (; i < end; ++i) {
        output[i] = inverseStep(input[i], k1, k2, dynamicShift(i, mask));
    }
}

// Fixed mode has k2 == 0, so only the leading XOR and the rotation remain.
void BlurUnrolledEngine::encryptFixed(const uint8_t* input, uint8_t* output,
                                      size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const unsigned shift = key_.fixedShift();

    size_t i = begin;
    for (; i + 8 <= end; i += 8) {
        output[i]     = rotateLeft8(static_cast<uint8_t>(input[i] ^ k1), shift);
        output[i + 1] = rotateLeft8(static_cast<uint8_t>(input[i + 1] ^ k1), shift);
        output[i + 2] = rotateLeft8(static_cast<uint8_t>(input[i + 2] ^ k1), shift);
        output[i + 3] = rotateLeft8(static_cast<uint8_t>(input[i + 3] ^ k1), shift);
        output[i + 4] = rotateLeft8(static_cast<uint8_t>(input[i + 4] ^ k1), shift);
        output[i + 5] = rotateLeft8(static_cast<uint8_t>(input[i + 5] ^ k1), shift);
        output[i + 6] = rotateLeft8(static_cast<uint8_t>(input[i + 6] ^ k1), shift);
        output[i + 7] = rotateLeft8(static_cast<uint8_t>(input[i + 7] ^ k1), shift);
    }
    for (; i < end; ++i) {
        output[i] = rotateLeft8(static_cast<uint8_t>(input[i] ^ k1), shift);
    }
}

void BlurUnrolledEngine::decryptFixed(const uint8_t* input, uint8_t* output,
                                      size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const unsigned shift = key_.fixedShift();

    size_t i = begin;
    for (; i + 8 <= end; i += 8) {
        output[i]     = rotateRight8(input[i], shift) ^ k1;
        output[i + 1] = rotateRight8(input[i + 1], shift) ^ k1;
        output[i + 2] = rotateRight8(input[i + 2], shift) ^ k1;
        output[i + 3] = rotateRight8(input[i + 3], shift) ^ k1;
        output[i + 4] = rotateRight8(input[i + 4], shift) ^ k1;
        output[i + 5] = rotateRight8(input[i + 5], shift) ^ k1;
        output[i + 6] = rotateRight8(input[i + 6], shift) ^ k1;
        output[i + 7] = rotateRight8(input[i + 7], shift) ^ k1;
    }
    for (; i < end; ++i) {
        output[i] = rotateRight8(input[i], shift) ^ k1;
    }
}

}
