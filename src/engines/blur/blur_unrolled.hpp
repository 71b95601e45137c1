#pragma once

#include "blur_chunked.hpp"

namespace xorblur {

// Manually unrolled loops: 4 bytes per block in dynamic mode, 8 in fixed mode.
class BlurUnrolledEngine : public ChunkedBlurEngine {
public:
    static constexpr size_t CHUNK_THRESHOLD = 8 * 1024;

    explicit BlurUnrolledEngine(const KeyMaterial& key, bool parallel = false);

    std::string getEngineName() const override { return "Unrolled"; }
    Strategy getStrategy() const override { return Strategy::Unrolled; }

    void encryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
    void decryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;

private:
    void encryptDynamic(const uint8_t* input, uint8_t* output, size_t begin, size_t end) const;
    void decryptDynamic(const uint8_t* input, uint8_t* output, size_t begin, size_t end) const;
    void encryptFixed(const uint8_t* input, uint8_t* output, size_t begin, size_t end) const;
    void decryptFixed(const uint8_t* input, uint8_t* output, size_t begin, size_t end) const;
};

}
