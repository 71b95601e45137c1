#pragma once

#include "engines/i_blur_engine.hpp"
#include "blur_table.hpp"
#include "blur_batched.hpp"
#include "blur_direct.hpp"

namespace xorblur {

// <= SMALL_LIMIT: LookupTable, <= MEDIUM_LIMIT: Batched, otherwise Direct.
class BlurAdaptiveEngine : public IBlurEngine {
public:
    static constexpr size_t SMALL_LIMIT = 256;
    static constexpr size_t MEDIUM_LIMIT = 4096;

    explicit BlurAdaptiveEngine(const KeyMaterial& key, bool parallel = false);

    std::string getEngineName() const override { return "Adaptive"; }
    Strategy getStrategy() const override { return Strategy::Adaptive; }

    void encrypt(const uint8_t* input, uint8_t* output, size_t size) override;
    void decrypt(const uint8_t* input, uint8_t* output, size_t size) override;

    const KeyMaterial& getKeyMaterial() const override { return key_; }

    void setParallel(bool enabled) override;
    bool isParallel() const override { return parallel_; }
    void setNumThreads(int threads) override;

    IBlurEngine& selectEngine(size_t size);

private:
    const KeyMaterial key_;
    bool parallel_;
    BlurTableEngine small_;
    BlurBatchedEngine medium_;
    BlurDirectEngine large_;
};

}
