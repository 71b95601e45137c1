#include "blur_batched.hpp"

namespace xorblur {

BlurBatchedEngine::BlurBatchedEngine(const KeyMaterial& key, bool parallel)
    : ChunkedBlurEngine(key, CHUNK_THRESHOLD, parallel) {}

void BlurBatchedEngine::encryptRange(const uint8_t* input, uint8_t* output,
                                     size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    unsigned shifts[BATCH_SIZE];
    uint8_t lane[BATCH_SIZE];

    size_t i = begin;
    for (; i + BATCH_SIZE <= end; i += BATCH_SIZE) {
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            shifts[j] = key_.shiftAt(i + j);
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            lane[j] = input[i + j] ^ k1;
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            lane[j] = rotateLeft8(lane[j], shifts[j]);
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            output[i + j] = lane[j] ^ k2;
        }
    }

    for (; i < end; ++i) {
        output[i] = key_.forwardByte(input[i], i);
    }
}

void BlurBatchedEngine::decryptRange(const uint8_t* input, uint8_t* output,
                                     size_t begin, size_t end) const {
    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    unsigned shifts[BATCH_SIZE];
    uint8_t lane[BATCH_SIZE];

    size_t i = begin;
    for (; i + BATCH_SIZE <= end; i += BATCH_SIZE) {
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            shifts[j] = key_.shiftAt(i + j);
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            lane[j] = input[i + j] ^ k2;
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            lane[j] = rotateRight8(lane[j], shifts[j]);
        }
        for (size_t j = 0; j < BATCH_SIZE; ++j) {
            output[i + j] = lane[j] ^ k1;
        }
    }

    for (; i < end; ++i) {
        output[i] = key_.inverseByte(input[i], i);
    }
}

}
