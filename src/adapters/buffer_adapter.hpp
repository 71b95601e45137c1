#pragma once

#include "engines/i_blur_engine.hpp"

namespace xorblur {

// Positions restart at 0 at the region start. Invalid regions return false.
class BufferAdapter {
public:
    explicit BufferAdapter(IBlurEngine& engine) : engine_(engine) {}

    bool encrypt(uint8_t* buffer, size_t capacity, size_t offset, size_t length);
    bool decrypt(uint8_t* buffer, size_t capacity, size_t offset, size_t length);

    bool encryptZeroCopy(uint8_t* buffer, size_t capacity, size_t offset, size_t length);
    bool decryptZeroCopy(uint8_t* buffer, size_t capacity, size_t offset, size_t length);

    static bool isValidRegion(const uint8_t* buffer, size_t capacity, size_t offset, size_t length);

private:
    IBlurEngine& engine_;
};

}
