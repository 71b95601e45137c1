#pragma once

#include "blur_chunked.hpp"
#include "core/rotation_tables.hpp"

namespace xorblur {

class BlurTableEngine : public ChunkedBlurEngine {
public:
    static constexpr size_t CHUNK_THRESHOLD = 16 * 1024;
    static constexpr size_t SMALL_RANGE = 8;

    explicit BlurTableEngine(const KeyMaterial& key, bool parallel = false);

    std::string getEngineName() const override { return "LookupTable"; }
    Strategy getStrategy() const override { return Strategy::LookupTable; }

    void encryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;
    void decryptRange(const uint8_t* input, uint8_t* output,
                      size_t begin, size_t end) const override;

private:
    uint8_t forward(uint8_t b, size_t position) const {
        return tables_.left(key_.shiftAt(position), static_cast<uint8_t>(b ^ key_.keyPart1())) ^ key_.keyPart2();
    }

    uint8_t inverse(uint8_t b, size_t position) const {
        return tables_.right(key_.shiftAt(position), static_cast<uint8_t>(b ^ key_.keyPart2())) ^ key_.keyPart1();
    }

    void encryptSmall(const uint8_t* input, uint8_t* output, size_t begin, size_t count) const;
    void decryptSmall(const uint8_t* input, uint8_t* output, size_t begin, size_t count) const;

    const RotationTables tables_;
};

}
