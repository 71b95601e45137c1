#include "text_codec.hpp"
#include <iconv.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace xorblur {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

class IconvHandle {
public:
    IconvHandle(const std::string& to, const std::string& from)
        : handle_(iconv_open(to.c_str(), from.c_str())) {
        if (handle_ == reinterpret_cast<iconv_t>(-1)) {
            throw EncodingError("Unsupported conversion " + from + " -> " + to);
        }
    }

    ~IconvHandle() { iconv_close(handle_); }

    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    // Lossy conversion replaces each undecodable byte with U+FFFD; the
    // target charset must then be UTF-8.
    std::string convert(const char* input, size_t size, bool lossy = false) {
        std::string out;
        if (size == 0) {
            return out;
        }

        char* in = const_cast<char*>(input);
        size_t inLeft = size;
        std::vector<char> buffer(size * 4 + 16);

        while (inLeft > 0) {
            char* outPtr = buffer.data();
            size_t outLeft = buffer.size();
            size_t rc = iconv(handle_, &in, &inLeft, &outPtr, &outLeft);
            out.append(buffer.data(), buffer.size() - outLeft);

            if (rc == static_cast<size_t>(-1)) {
                if (errno == E2BIG) {
                    continue;
                }
                if (lossy) {
                    out.append(REPLACEMENT_CHARACTER);
                    ++in;
                    --inLeft;
                    iconv(handle_, nullptr, nullptr, nullptr, nullptr);
                    continue;
                }
                if (errno == EILSEQ) {
                    throw EncodingError("Invalid character sequence at offset " +
                                        std::to_string(size - inLeft));
                }
                throw EncodingError("Truncated character sequence at end of input");
            }
        }

        char* outPtr = buffer.data();
        size_t outLeft = buffer.size();
        if (iconv(handle_, nullptr, nullptr, &outPtr, &outLeft) == static_cast<size_t>(-1)) {
            throw EncodingError(std::string("Failed to flush conversion state: ") + std::strerror(errno));
        }
        out.append(buffer.data(), buffer.size() - outLeft);
        return out;
    }

private:
    iconv_t handle_;
};

}

TextCodec::TextCodec(const std::string& charset) : charset_(charset) {
    if (charset_.empty()) {
        throw EncodingError("Charset name must not be empty");
    }
    if (!isUtf8()) {
        // Fail at construction for unknown charsets.
        IconvHandle probe(charset_, "UTF-8");
    }
}

bool TextCodec::isUtf8() const {
    std::string lower = charset_;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "utf-8" || lower == "utf8";
}

std::vector<uint8_t> TextCodec::encode(const std::string& text) const {
    // UTF-8 targets still go through iconv so malformed input is rejected.
    IconvHandle cd(charset_, "UTF-8");
    std::string converted = cd.convert(text.data(), text.size());
    return std::vector<uint8_t>(converted.begin(), converted.end());
}

std::string TextCodec::decode(const std::vector<uint8_t>& bytes) const {
    return decode(bytes.data(), bytes.size());
}

std::string TextCodec::decode(const uint8_t* bytes, size_t size) const {
    if (size == 0) {
        return std::string();
    }
    IconvHandle cd("UTF-8", charset_);
    return cd.convert(reinterpret_cast<const char*>(bytes), size);
}

std::string TextCodec::decodeLossy(const std::vector<uint8_t>& bytes) const {
    if (bytes.empty()) {
        return std::string();
    }
    IconvHandle cd("UTF-8", charset_);
    return cd.convert(reinterpret_cast<const char*>(bytes.data()), bytes.size(), true);
}

}
