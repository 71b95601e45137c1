#include "blur_codec.hpp"
#include "adapters/base64.hpp"
#include <stdexcept>
#include <utility>

namespace xorblur {

BlurCodec::BlurCodec(BlurEnginePtr engine, const std::string& charset)
    : engine_(std::move(engine)), text_(charset) {
    if (!engine_) {
        throw std::invalid_argument("BlurCodec requires an engine");
    }
}

std::string BlurCodec::encryptBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }
    return base64Encode(engine_->encryptBytes(data));
}

std::string BlurCodec::encryptText(const std::string& text) {
    return encryptBase64(text_.encode(text));
}

std::vector<uint8_t> BlurCodec::decryptBytes(const std::string& base64Text) {
    std::vector<uint8_t> data = base64Decode(base64Text);
    engine_->decryptInPlace(data);
    return data;
}

std::string BlurCodec::decryptStr(const std::string& base64Text) {
    return text_.decodeLossy(decryptBytes(base64Text));
}

}
