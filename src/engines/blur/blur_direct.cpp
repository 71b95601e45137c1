#include "blur_direct.hpp"

namespace xorblur {

BlurDirectEngine::BlurDirectEngine(const KeyMaterial& key, bool parallel)
    : ChunkedBlurEngine(key, CHUNK_THRESHOLD, parallel) {}

void BlurDirectEngine::encryptRange(const uint8_t* input, uint8_t* output,
                                    size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    for (size_t i = begin; i < end; ++i) {
        uint8_t b = input[i] ^ k1;
        unsigned shift = key_.shiftAt(i);
        if (shift != 0) {
            b = rotateLeft8(b, shift);
        }
        output[i] = b ^ k2;
    }
}

void BlurDirectEngine::decryptRange(const uint8_t* input, uint8_t* output,
                                    size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    for (size_t i = begin; i < end; ++i) {
        uint8_t b = input[i] ^ k2;
        unsigned shift = key_.shiftAt(i);
        if (shift != 0) {
            b = rotateRight8(b, shift);
        }
        output[i] = b ^ k1;
    }
}

}
