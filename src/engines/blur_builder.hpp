#pragma once

#include "engines/i_blur_engine.hpp"

#include <string>

namespace xorblur {

struct BlurConfig {
    std::string encoding = "UTF-8";
    Strategy strategy = Strategy::Direct;
    bool dynamicShift = true;
    bool parallelProcessing = false;
    int numThreads = 0;
    uint64_t secretKey = DEFAULT_SECRET_KEY;
    uint8_t keySegment = DEFAULT_KEY_SEGMENT;
    uint8_t simpleKey = DEFAULT_SIMPLE_KEY;
    int shiftValue = DEFAULT_SHIFT_VALUE;

    // Dynamic mode keys from secretKey/keySegment, fixed mode from simpleKey/shiftValue.
    KeyMaterial keyMaterial() const;
};

BlurEnginePtr createEngine(Strategy strategy, const KeyMaterial& key, bool parallel = false);

class BlurBuilder {
public:
    BlurBuilder& withEncoding(const std::string& encoding);
    BlurBuilder& withStrategy(Strategy strategy);
    BlurBuilder& withDynamicShift(bool dynamicShift);
    BlurBuilder& withParallelProcessing(bool parallelProcessing);
    BlurBuilder& withNumThreads(int threads);
    BlurBuilder& withSecretKey(uint64_t secretKey);
    BlurBuilder& withKeySegment(uint8_t keySegment);
    BlurBuilder& withSimpleKey(uint8_t simpleKey);
    BlurBuilder& withShiftValue(int shiftValue);

    const BlurConfig& config() const { return config_; }

    BlurEnginePtr build() const;

private:
    BlurConfig config_;
};

}
