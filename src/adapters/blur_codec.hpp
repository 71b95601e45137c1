#pragma once

#include "engines/i_blur_engine.hpp"
#include "adapters/text_codec.hpp"

#include <string>
#include <vector>

namespace xorblur {

// Text-facing wrapper: transform + Base64 + charset conversion.
class BlurCodec {
public:
    BlurCodec(BlurEnginePtr engine, const std::string& charset = "UTF-8");

    // Empty input gives an empty string.
    std::string encryptBase64(const std::vector<uint8_t>& data);
    std::string encryptText(const std::string& text);

    // Both throw DecodeError on malformed Base64. decryptStr substitutes
    // U+FFFD for bytes that are not valid in the codec's charset.
    std::vector<uint8_t> decryptBytes(const std::string& base64Text);
    std::string decryptStr(const std::string& base64Text);

private:
    BlurEnginePtr engine_;
    TextCodec text_;
};

}
