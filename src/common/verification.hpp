#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace xorblur {

std::string calculateSHA256(const uint8_t* data, size_t size);
std::string calculateSHA256(const std::vector<uint8_t>& data);

bool verifyBuffers(const uint8_t* original, const uint8_t* decrypted, size_t size);

// Fills the buffer from OpenSSL's CSPRNG.
void fillRandom(std::vector<uint8_t>& buffer);

}
