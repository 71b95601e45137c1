#include "blur_table.hpp"

namespace xorblur {

BlurTableEngine::BlurTableEngine(const KeyMaterial& key, bool parallel)
    : ChunkedBlurEngine(key, CHUNK_THRESHOLD, parallel) {}

void BlurTableEngine::encryptRange(const uint8_t* input, uint8_t* output,
                                   size_t begin, size_t end) const {
    if (end - begin <= SMALL_RANGE) {
        encryptSmall(input, output, begin, end - begin);
        return;
    }

    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    if (key_.isDynamic()) {
        const uint8_t mask = key_.shiftMask();
        for (size_t i = begin; i < end; ++i) {
            output[i] = tables_.left(dynamicShift(i, mask), static_cast<uint8_t>(input[i] ^ k1)) ^ k2;
        }
    } else {
        const auto& row = tables_.leftRow(key_.fixedShift());
        for (size_t i = begin; i < end; ++i) {
            output[i] = row[static_cast<uint8_t>(input[i] ^ k1)];
        }
    }
}

void BlurTableEngine::decryptRange(const uint8_t* input, uint8_t* output,
                                   size_t begin, size_t end) const {
    if (end - begin <= SMALL_RANGE) {
        decryptSmall(input, output, begin, end - begin);
        return;
    }

    const uint8_t k1 = key_.keyPart1();
    const uint8_t k2 = key_.keyPart2();

    if (key_.isDynamic()) {
        const uint8_t mask = key_.shiftMask();
        for (size_t i = begin; i < end; ++i) {
            output[i] = tables_.right(dynamicShift(i, mask), static_cast<uint8_t>(input[i] ^ k2)) ^ k1;
        }
    } else {
        const auto& row = tables_.rightRow(key_.fixedShift());
        for (size_t i = begin; i < end; ++i) {
            output[i] = row[input[i]] ^ k1;
        }
    }
}

void BlurTableEngine::encryptSmall(const uint8_t* input, uint8_t* output,
                                   size_t begin, size_t count) const {
    const uint8_t* in = input + begin;
    uint8_t* out = output + begin;

    switch (count) {
        case 8: out[7] = forward(in[7], begin + 7); // fall through
        case 7: out[6] = forward(in[6], begin + 6); // fall through
        case 6: out[5] = forward(in[5], begin + 5); // fall through
        case 5: out[4] = forward(in[4], begin + 4); // fall through
        case 4: out[3] = forward(in[3], begin + 3); // fall through
        case 3: out[2] = forward(in[2], begin + 2); // fall through
        case 2: out[1] = forward(in[1], begin + 1); // fall through
        case 1: out[0] = forward(in[0], begin);
        default:
            break;
    }
}

void BlurTableEngine::decryptSmall(const uint8_t* input, uint8_t* output,
                                   size_t begin, size_t count) const {
    const uint8_t* in = input + begin;
    uint8_t* out = output + begin;

    switch (count) {
        case 8: out[7] = inverse(in[7], begin + 7); // fall through
        case 7: out[6] = inverse(in[6], begin + 6); // fall through
        case 6: out[5] = inverse(in[5], begin + 5); // fall through
        case 5: out[4] = inverse(in[4], begin + 4); // fall through
        case 4: out[3] = inverse(in[3], begin + 3); // fall through
        case 3: out[2] = inverse(in[2], begin + 2); // fall through
        case 2: out[1] = inverse(in[1], begin + 1); // fall through
        case 1: out[0] = inverse(in[0], begin);
        default:
            break;
    }
}

}
