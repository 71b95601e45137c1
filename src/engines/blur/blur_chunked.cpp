#include "blur_chunked.hpp"
#include <stdexcept>

namespace xorblur {

namespace {

void checkArguments(const uint8_t* input, uint8_t* output, size_t size) {
    if (size > 0 && (input == nullptr || output == nullptr)) {
        throw std::invalid_argument("Null buffer passed with non-zero size");
    }
}

}

ChunkedBlurEngine::ChunkedBlurEngine(const KeyMaterial& key, size_t chunkThreshold, bool parallel)
    : key_(key), executor_(chunkThreshold), parallel_(parallel) {}

void ChunkedBlurEngine::encrypt(const uint8_t* input, uint8_t* output, size_t size) {
    checkArguments(input, output, size);
    if (size == 0) {
        return;
    }

    if (!parallel_) {
        encryptRange(input, output, 0, size);
        return;
    }

    executor_.run(size, [this, input, output](size_t begin, size_t end) {
        encryptRange(input, output, begin, end);
    });
}

void ChunkedBlurEngine::decrypt(const uint8_t* input, uint8_t* output, size_t size) {
    checkArguments(input, output, size);
    if (size == 0) {
        return;
    }

    if (!parallel_) {
        decryptRange(input, output, 0, size);
        return;
    }

    executor_.run(size, [this, input, output](size_t begin, size_t end) {
        decryptRange(input, output, begin, end);
    });
}

}
