#include "blur_builder.hpp"
#include "engines/blur/blur_direct.hpp"
#include "engines/blur/blur_unrolled.hpp"
#include "engines/blur/blur_table.hpp"
#include "engines/blur/blur_batched.hpp"
#include "engines/blur/blur_adaptive.hpp"
#include "engines/blur/blur_opencl.hpp"

#include <algorithm>
#include <cctype>

namespace xorblur {

std::string toString(Strategy strategy) {
    switch (strategy) {
        case Strategy::Direct: return "direct";
        case Strategy::Unrolled: return "unrolled";
        case Strategy::LookupTable: return "table";
        case Strategy::Batched: return "batched";
        case Strategy::Adaptive: return "adaptive";
        case Strategy::OpenCL: return "opencl";
    }
    return "unknown";
}

bool parseStrategy(const std::string& name, Strategy& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "direct") out = Strategy::Direct;
    else if (lower == "unrolled") out = Strategy::Unrolled;
    else if (lower == "table" || lower == "lookup" || lower == "lookuptable") out = Strategy::LookupTable;
    else if (lower == "batched" || lower == "batch") out = Strategy::Batched;
    else if (lower == "adaptive") out = Strategy::Adaptive;
    else if (lower == "opencl") out = Strategy::OpenCL;
    else return false;
    return true;
}

KeyMaterial BlurConfig::keyMaterial() const {
    if (dynamicShift) {
        return KeyMaterial::dynamic(secretKey, keySegment);
    }
    return KeyMaterial::fixed(simpleKey, shiftValue);
}

BlurEnginePtr createEngine(Strategy strategy, const KeyMaterial& key, bool parallel) {
    switch (strategy) {
        case Strategy::Unrolled:
            return std::make_unique<BlurUnrolledEngine>(key, parallel);
        case Strategy::LookupTable:
            return std::make_unique<BlurTableEngine>(key, parallel);
        case Strategy::Batched:
            return std::make_unique<BlurBatchedEngine>(key, parallel);
        case Strategy::Adaptive:
            return std::make_unique<BlurAdaptiveEngine>(key, parallel);
        case Strategy::OpenCL:
            return std::make_unique<BlurOpenCLEngine>(key, parallel);
        case Strategy::Direct:
        default:
            return std::make_unique<BlurDirectEngine>(key, parallel);
    }
}

BlurBuilder& BlurBuilder::withEncoding(const std::string& encoding) {
    config_.encoding = encoding;
    return *this;
}

BlurBuilder& BlurBuilder::withStrategy(Strategy strategy) {
    config_.strategy = strategy;
    return *this;
}

BlurBuilder& BlurBuilder::withDynamicShift(bool dynamicShift) {
    config_.dynamicShift = dynamicShift;
    return *this;
}

BlurBuilder& BlurBuilder::withParallelProcessing(bool parallelProcessing) {
    config_.parallelProcessing = parallelProcessing;
    return *this;
}

BlurBuilder& BlurBuilder::withNumThreads(int threads) {
    config_.numThreads = threads;
    return *this;
}

BlurBuilder& BlurBuilder::withSecretKey(uint64_t secretKey) {
    config_.secretKey = secretKey;
    return *this;
}

BlurBuilder& BlurBuilder::withKeySegment(uint8_t keySegment) {
    config_.keySegment = keySegment;
    return *this;
}

BlurBuilder& BlurBuilder::withSimpleKey(uint8_t simpleKey) {
    config_.simpleKey = simpleKey;
    return *this;
}

BlurBuilder& BlurBuilder::withShiftValue(int shiftValue) {
    config_.shiftValue = shiftValue & 0x7;
    return *this;
}

BlurEnginePtr BlurBuilder::build() const {
    BlurEnginePtr engine = createEngine(config_.strategy, config_.keyMaterial(),
                                        config_.parallelProcessing);
    if (config_.numThreads > 0) {
        engine->setNumThreads(config_.numThreads);
    }
    return engine;
}

}
