#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace xorblur {

class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& what) : std::runtime_error(what) {}
};

// Any charset iconv knows is accepted.
class TextCodec {
public:
    explicit TextCodec(const std::string& charset = "UTF-8");

    const std::string& getCharset() const { return charset_; }

    std::vector<uint8_t> encode(const std::string& text) const;
    std::string decode(const std::vector<uint8_t>& bytes) const;
    std::string decode(const uint8_t* bytes, size_t size) const;

    // Never throws on bad input; undecodable bytes become U+FFFD.
    std::string decodeLossy(const std::vector<uint8_t>& bytes) const;

private:
    bool isUtf8() const;

    std::string charset_;
};

}
