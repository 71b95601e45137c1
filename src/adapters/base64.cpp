#include "base64.hpp"
#include <openssl/evp.h>
#include <climits>

namespace xorblur {

std::string base64Encode(const uint8_t* data, size_t size) {
    if (size == 0) {
        return std::string();
    }
    if (size > static_cast<size_t>(INT_MAX / 4 * 3)) {
        throw std::length_error("Input too large for Base64 encoding");
    }

    std::string out(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(size));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

std::vector<uint8_t> base64Decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() > static_cast<size_t>(INT_MAX - 3)) {
        throw DecodeError("Base64 input too large");
    }

    // Padding is optional; an unpadded final quantum is completed here.
    std::string padded = text;
    size_t remainder = text.size() % 4;
    if (remainder == 1) {
        throw DecodeError("Base64 input ends with a dangling character");
    }
    if (remainder != 0) {
        if (text.find('=') != std::string::npos) {
            throw DecodeError("Padded Base64 input length is not a multiple of 4");
        }
        padded.append(4 - remainder, '=');
    }

    size_t padding = 0;
    for (size_t i = 0; i < padded.size(); ++i) {
        char c = padded[i];
        if (c == '=') {
            ++padding;
            continue;
        }
        bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                     (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!valid) {
            throw DecodeError("Invalid Base64 character at offset " + std::to_string(i));
        }
        if (padding > 0) {
            throw DecodeError("Base64 padding must only appear at the end");
        }
    }
    if (padding > 2) {
        throw DecodeError("Too much Base64 padding");
    }

    std::vector<uint8_t> out(padded.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (decoded < 0) {
        throw DecodeError("Malformed Base64 input");
    }

    // EVP_DecodeBlock counts the zero bytes produced by padding.
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

}
