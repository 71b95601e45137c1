#include "blur_adaptive.hpp"

namespace xorblur {

BlurAdaptiveEngine::BlurAdaptiveEngine(const KeyMaterial& key, bool parallel)
    : key_(key), parallel_(parallel),
      small_(key, parallel), medium_(key, parallel), large_(key, parallel) {}

IBlurEngine& BlurAdaptiveEngine::selectEngine(size_t size) {
    if (size <= SMALL_LIMIT) {
        return small_;
    }
    if (size <= MEDIUM_LIMIT) {
        return medium_;
    }
    return large_;
}

void BlurAdaptiveEngine::encrypt(const uint8_t* input, uint8_t* output, size_t size) {
    selectEngine(size).encrypt(input, output, size);
}

void BlurAdaptiveEngine::decrypt(const uint8_t* input, uint8_t* output, size_t size) {
    selectEngine(size).decrypt(input, output, size);
}

void BlurAdaptiveEngine::setParallel(bool enabled) {
    parallel_ = enabled;
    small_.setParallel(enabled);
    medium_.setParallel(enabled);
    large_.setParallel(enabled);
}

void BlurAdaptiveEngine::setNumThreads(int threads) {
    small_.setNumThreads(threads);
    medium_.setNumThreads(threads);
    large_.setNumThreads(threads);
}

}
