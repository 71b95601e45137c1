#pragma once

#include "blur_chunked.hpp"

namespace xorblur {

class BlurDirectEngine : public ChunkedBlurEngine {
public:
    static constexpr size_t CHUNK_THRESHOLD = 8 * 1024;

    explicit BlurDirectEngine(const KeyMaterial& key, bool parallel = false);

    std::string getEngineName() const override { return "Direct"; }
    Strategy getStrategy() const override { return Strategy::Direct; }

    void encryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
    void decryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
};

}
