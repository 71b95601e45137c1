#pragma once

#include "engines/i_blur_engine.hpp"
#include "common/chunk_executor.hpp"

namespace xorblur {

// Subclasses transform [begin, end) using absolute buffer positions.
class ChunkedBlurEngine : public IBlurEngine {
public:
    ChunkedBlurEngine(const KeyMaterial& key, size_t chunkThreshold, bool parallel);

    void encrypt(const uint8_t* input, uint8_t* output, size_t size) override;
    void decrypt(const uint8_t* input, uint8_t* output, size_t size) override;

    const KeyMaterial& getKeyMaterial() const override { return key_; }

    void setParallel(bool enabled) override { parallel_ = enabled; }
    bool isParallel() const override { return parallel_; }
    void setNumThreads(int threads) override { executor_.setNumThreads(threads); }
    int getNumThreads() const { return executor_.getNumThreads(); }

    size_t getChunkThreshold() const { return executor_.getThreshold(); }

    virtual void encryptRange(const uint8_t* input, uint8_t* output,
                              size_t begin, size_t end) const = 0;
    virtual void decryptRange(const uint8_t* input, uint8_t* output,
                              size_t begin, size_t end) const = 0;

protected:
    const KeyMaterial key_;

private:
    ParallelChunkExecutor executor_;
    bool parallel_;
};

}
