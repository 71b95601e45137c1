#include "buffer_adapter.hpp"
#include <cstring>
#include <vector>

namespace xorblur {

bool BufferAdapter::isValidRegion(const uint8_t* buffer, size_t capacity, size_t offset, size_t length) {
    if (buffer == nullptr || length == 0) {
        return false;
    }
    return offset <= capacity && length <= capacity - offset;
}

bool BufferAdapter::encrypt(uint8_t* buffer, size_t capacity, size_t offset, size_t length) {
    if (!isValidRegion(buffer, capacity, offset, length)) {
        return false;
    }

    std::vector<uint8_t> temp(buffer + offset, buffer + offset + length);
    engine_.encryptInPlace(temp);
    std::memcpy(buffer + offset, temp.data(), length);
    return true;
}

bool BufferAdapter::decrypt(uint8_t* buffer, size_t capacity, size_t offset, size_t length) {
    if (!isValidRegion(buffer, capacity, offset, length)) {
        return false;
    }

    std::vector<uint8_t> temp(buffer + offset, buffer + offset + length);
    engine_.decryptInPlace(temp);
    std::memcpy(buffer + offset, temp.data(), length);
    return true;
}

bool BufferAdapter::encryptZeroCopy(uint8_t* buffer, size_t capacity, size_t offset, size_t length) {
    if (!isValidRegion(buffer, capacity, offset, length)) {
        return false;
    }

    uint8_t* region = buffer + offset;
    engine_.encrypt(region, region, length);
    return true;
}

bool BufferAdapter::decryptZeroCopy(uint8_t* buffer, size_t capacity, size_t offset, size_t length) {
    if (!isValidRegion(buffer, capacity, offset, length)) {
        return false;
    }

    uint8_t* region = buffer + offset;
    engine_.decrypt(region, region, length);
    return true;
}

}
