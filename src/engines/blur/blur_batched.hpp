#pragma once

#include "blur_chunked.hpp"

namespace xorblur {

// Eight bytes per iteration with the batch's shift amounts computed up front.
class BlurBatchedEngine : public ChunkedBlurEngine {
public:
    static constexpr size_t CHUNK_THRESHOLD = 4 * 1024;
    static constexpr size_t BATCH_SIZE = 8;

    explicit BlurBatchedEngine(const KeyMaterial& key, bool parallel = false);

    std::string getEngineName() const override { return "Batched"; }
    Strategy getStrategy() const override { return Strategy::Batched; }

    void encryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
    void decryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
};

}
