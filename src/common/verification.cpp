#include "verification.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <climits>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace xorblur {

std::string calculateSHA256(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_Digest(data, size, digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string calculateSHA256(const std::vector<uint8_t>& data) {
    return calculateSHA256(data.data(), data.size());
}

bool verifyBuffers(const uint8_t* original, const uint8_t* decrypted, size_t size) {
    if (size == 0) {
        return true;
    }
    return std::memcmp(original, decrypted, size) == 0;
}

void fillRandom(std::vector<uint8_t>& buffer) {
    size_t offset = 0;
    while (offset < buffer.size()) {
        int chunk = static_cast<int>(std::min<size_t>(buffer.size() - offset, INT_MAX));
        if (RAND_bytes(buffer.data() + offset, chunk) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        offset += static_cast<size_t>(chunk);
    }
}

}
