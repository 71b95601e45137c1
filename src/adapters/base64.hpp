#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace xorblur {

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Standard alphabet with '=' padding and no line breaks.
std::string base64Encode(const uint8_t* data, size_t size);
std::string base64Encode(const std::vector<uint8_t>& data);

// Padding may be omitted. Throws DecodeError on bad length, bad characters
// or misplaced padding.
std::vector<uint8_t> base64Decode(const std::string& text);

}
