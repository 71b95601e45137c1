#pragma once

#include "engines/i_blur_engine.hpp"
#include "blur_direct.hpp"

namespace xorblur {

// One command queue per instance; do not share an instance across threads.
class BlurOpenCLEngine : public IBlurEngine {
public:
    explicit BlurOpenCLEngine(const KeyMaterial& key, bool parallel = false);
    ~BlurOpenCLEngine() override;

    BlurOpenCLEngine(const BlurOpenCLEngine&) = delete;
    BlurOpenCLEngine& operator=(const BlurOpenCLEngine&) = delete;

    std::string getEngineName() const override { return "OpenCL"; }
    Strategy getStrategy() const override { return Strategy::OpenCL; }

    void encrypt(const uint8_t* input, uint8_t* output, size_t size) override;
    void decrypt(const uint8_t* input, uint8_t* output, size_t size) override;

    const KeyMaterial& getKeyMaterial() const override { return fallback_.getKeyMaterial(); }

    bool isAvailable() const override;
    void initialize() override;
    void cleanup() override;

    // Parallel settings only affect the CPU fallback.
    void setParallel(bool enabled) override { fallback_.setParallel(enabled); }
    bool isParallel() const override { return fallback_.isParallel(); }
    void setNumThreads(int threads) override { fallback_.setNumThreads(threads); }

private:
    void run(bool forward, const uint8_t* input, uint8_t* output, size_t size);

    struct Impl;
    Impl* impl_;
    bool initialized_;
    BlurDirectEngine fallback_;
};

}
