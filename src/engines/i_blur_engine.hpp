#pragma once

#include "core/key_material.hpp"

#include <string>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

namespace xorblur {

enum class Strategy {
    Direct,
    Unrolled,
    LookupTable,
    Batched,
    Adaptive,
    OpenCL
};

std::string toString(Strategy strategy);
bool parseStrategy(const std::string& name, Strategy& out);

class IBlurEngine {
public:
    virtual ~IBlurEngine() = default;

    virtual std::string getEngineName() const = 0;
    virtual Strategy getStrategy() const = 0;

    // output may alias input; a null input is accepted only with size 0.
    virtual void encrypt(const uint8_t* input, uint8_t* output, size_t size) = 0;
    virtual void decrypt(const uint8_t* input, uint8_t* output, size_t size) = 0;

    virtual const KeyMaterial& getKeyMaterial() const = 0;

    virtual bool isAvailable() const { return true; }

    virtual void initialize() {}
    virtual void cleanup() {}

    virtual void setParallel(bool enabled) = 0;
    virtual bool isParallel() const = 0;
    virtual void setNumThreads(int threads) = 0;

    std::vector<uint8_t> encryptBytes(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> out(data.size());
        encrypt(data.data(), out.data(), data.size());
        return out;
    }

    std::vector<uint8_t> decryptBytes(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> out(data.size());
        decrypt(data.data(), out.data(), data.size());
        return out;
    }

    void encryptInPlace(std::vector<uint8_t>& data) {
        encrypt(data.data(), data.data(), data.size());
    }

    void decryptInPlace(std::vector<uint8_t>& data) {
        decrypt(data.data(), data.data(), data.size());
    }
};

using BlurEnginePtr = std::unique_ptr<IBlurEngine>;

}
