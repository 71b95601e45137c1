#include "adapters/base64.hpp"
#include "adapters/blur_codec.hpp"
#include "adapters/buffer_adapter.hpp"
#include "adapters/text_codec.hpp"
#include "engines/blur_builder.hpp"
#include "engines/blur/blur_direct.hpp"
#include "test_data.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xorblur;
using xorblur::fixtures::randomBytes;

namespace {

const std::string kHello = "Hello World";

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}

TEST(Base64Test, EncodesKnownVectors) {
    EXPECT_EQ(base64Encode(bytesOf("")), "");
    EXPECT_EQ(base64Encode(bytesOf("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytesOf("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(bytesOf("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodesPaddingCorrectly) {
    EXPECT_EQ(base64Decode("Zg=="), bytesOf("f"));
    EXPECT_EQ(base64Decode("Zm8="), bytesOf("fo"));
    EXPECT_EQ(base64Decode("Zm9vYmFy"), bytesOf("foobar"));
    EXPECT_TRUE(base64Decode("").empty());
}

TEST(Base64Test, AcceptsMissingPadding) {
    EXPECT_EQ(base64Decode("Zg"), bytesOf("f"));
    EXPECT_EQ(base64Decode("Zm8"), bytesOf("fo"));
    EXPECT_EQ(base64Decode("u0SEFyi6hRumTZQ"), base64Decode("u0SEFyi6hRumTZQ="));
}

TEST(Base64Test, BinaryRoundTrip) {
    std::vector<uint8_t> data = randomBytes(1001);
    EXPECT_EQ(base64Decode(base64Encode(data)), data);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_THROW(base64Decode("abcde"), DecodeError);
    EXPECT_THROW(base64Decode("Zg="), DecodeError);
    EXPECT_THROW(base64Decode("ab!d"), DecodeError);
    EXPECT_THROW(base64Decode("a=bc"), DecodeError);
    EXPECT_THROW(base64Decode("a==="), DecodeError);
    EXPECT_THROW(base64Decode("Zg==Zg=="), DecodeError);
    EXPECT_THROW(base64Decode("Zm9v\nYmFy"), DecodeError);
}

TEST(TextCodecTest, Utf8IsPassThrough) {
    TextCodec codec;
    EXPECT_EQ(codec.getCharset(), "UTF-8");
    const std::string text = "h\xC3\xA9llo";
    EXPECT_EQ(codec.encode(text), bytesOf(text));
    EXPECT_EQ(codec.decode(bytesOf(text)), text);
}

TEST(TextCodecTest, Latin1RoundTrip) {
    TextCodec codec("ISO-8859-1");
    const std::string text = "caf\xC3\xA9";  // "café" in UTF-8
    std::vector<uint8_t> encoded = codec.encode(text);
    EXPECT_EQ(encoded, (std::vector<uint8_t>{'c', 'a', 'f', 0xE9}));
    EXPECT_EQ(codec.decode(encoded), text);
}

TEST(TextCodecTest, Utf16LittleEndianRoundTrip) {
    TextCodec codec("UTF-16LE");
    std::vector<uint8_t> encoded = codec.encode("Hi");
    EXPECT_EQ(encoded, (std::vector<uint8_t>{'H', 0x00, 'i', 0x00}));
    EXPECT_EQ(codec.decode(encoded), "Hi");
}

TEST(TextCodecTest, UnknownCharsetThrows) {
    EXPECT_THROW(TextCodec("NO-SUCH-CHARSET-42"), EncodingError);
    EXPECT_THROW(TextCodec(""), EncodingError);
}

TEST(TextCodecTest, InvalidSequencesThrow) {
    TextCodec utf8;
    EXPECT_THROW(utf8.decode(std::vector<uint8_t>{0xC3, 0x28}), EncodingError);

    TextCodec latin1("ISO-8859-1");
    EXPECT_THROW(latin1.encode("\xE2\x9C\x93"), EncodingError);
}

TEST(TextCodecTest, MalformedUtf8IsRejectedOnEncode) {
    TextCodec utf8;
    EXPECT_THROW(utf8.encode("ab\xFF" "cd"), EncodingError);
    EXPECT_THROW(utf8.encode("\xC3"), EncodingError);
}

TEST(TextCodecTest, LossyDecodeSubstitutesReplacementCharacter) {
    TextCodec utf8;
    EXPECT_EQ(utf8.decodeLossy(std::vector<uint8_t>{'a', 0xFF, 'b'}), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(utf8.decodeLossy(std::vector<uint8_t>{0xC3, 0x28}), "\xEF\xBF\xBD(");
    EXPECT_EQ(utf8.decodeLossy(bytesOf("plain")), "plain");
    EXPECT_EQ(utf8.decodeLossy(std::vector<uint8_t>()), "");

    TextCodec utf16("UTF-16LE");
    EXPECT_EQ(utf16.decodeLossy(std::vector<uint8_t>{'H', 0x00, 'i'}), "H\xEF\xBF\xBD");
}

TEST(TextCodecTest, EmptyInput) {
    TextCodec codec("UTF-16LE");
    EXPECT_TRUE(codec.encode("").empty());
    EXPECT_EQ(codec.decode(std::vector<uint8_t>()), "");
}

TEST(BlurCodecTest, HelloWorldGoldenCiphertext) {
    BlurCodec codec(BlurBuilder().build());
    EXPECT_EQ(codec.encryptText(kHello), "u0SEFyi6hRumTZQ=");
    EXPECT_EQ(codec.decryptStr("u0SEFyi6hRumTZQ="), kHello);
}

TEST(BlurCodecTest, FixedModeGoldenCiphertext) {
    BlurCodec codec(BlurBuilder().withDynamicShift(false).build());
    EXPECT_EQ(codec.encryptText(kHello), "H3Y+PiZc5ybOPn4=");
    EXPECT_EQ(codec.decryptStr("H3Y+PiZc5ybOPn4="), kHello);
}

TEST(BlurCodecTest, NonAsciiRoundTrip) {
    const std::string text = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93";
    BlurCodec codec(BlurBuilder().build());
    std::string encrypted = codec.encryptText(text);
    EXPECT_EQ(encrypted, "q+IPFzBOax1+l7gXcLoz51Y=");
    EXPECT_EQ(codec.decryptStr(encrypted), text);
}

TEST(BlurCodecTest, RoundTripThroughOtherCharset) {
    BlurCodec codec(BlurBuilder().withStrategy(Strategy::Batched).build(), "UTF-16LE");
    const std::string text = "Gr\xC3\xBC\xC3\x9F" "e aus Berlin";
    EXPECT_EQ(codec.decryptStr(codec.encryptText(text)), text);
}

TEST(BlurCodecTest, BytesRoundTripAndEmptyInput) {
    BlurCodec codec(BlurBuilder().withStrategy(Strategy::LookupTable).build());
    std::vector<uint8_t> data = randomBytes(777);
    EXPECT_EQ(codec.decryptBytes(codec.encryptBase64(data)), data);

    EXPECT_EQ(codec.encryptBase64(std::vector<uint8_t>()), "");
    EXPECT_TRUE(codec.decryptBytes("").empty());
    EXPECT_EQ(codec.decryptStr(""), "");
}

TEST(BlurCodecTest, WrongKeyYieldsWrongTextWithoutError) {
    const std::string text = "Hello World, this is a longer message";
    BlurCodec right(BlurBuilder().build());
    BlurCodec wrong(BlurBuilder().withSecretKey(DEFAULT_SECRET_KEY ^ 0x0101).build());

    std::string decrypted;
    EXPECT_NO_THROW(decrypted = wrong.decryptStr(right.encryptText(text)));
    EXPECT_NE(decrypted, text);
    EXPECT_FALSE(decrypted.empty());
}

TEST(BlurCodecTest, MalformedUtf8TextIsRejectedBeforeEncryption) {
    BlurCodec codec(BlurBuilder().build());
    EXPECT_THROW(codec.encryptText("ab\xFF" "cd"), EncodingError);
}

TEST(BlurCodecTest, Latin1TextRoundTrip) {
    BlurCodec codec(BlurBuilder().withStrategy(Strategy::Unrolled).build(), "ISO-8859-1");
    const std::string text = "caf\xC3\xA9 cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e";
    std::string encrypted = codec.encryptText(text);
    EXPECT_EQ(base64Decode(encrypted).size(), 17u);
    EXPECT_EQ(codec.decryptStr(encrypted), text);
}

TEST(BlurCodecTest, ErrorsPropagate) {
    BlurCodec codec(BlurBuilder().build());
    EXPECT_THROW(codec.decryptStr("not base64"), DecodeError);
    EXPECT_THROW(BlurCodec{BlurEnginePtr()}, std::invalid_argument);
}

class BufferAdapterTest : public ::testing::Test {
protected:
    BufferAdapterTest()
        : engine_(KeyMaterial::dynamic(DEFAULT_SECRET_KEY, DEFAULT_KEY_SEGMENT)),
          adapter_(engine_) {}

    BlurDirectEngine engine_;
    BufferAdapter adapter_;
};

TEST_F(BufferAdapterTest, RejectsInvalidRegions) {
    std::vector<uint8_t> buffer(64, 0x11);
    const std::vector<uint8_t> original = buffer;

    EXPECT_FALSE(adapter_.encrypt(nullptr, 64, 0, 8));
    EXPECT_FALSE(adapter_.encrypt(buffer.data(), buffer.size(), 0, 0));
    EXPECT_FALSE(adapter_.encrypt(buffer.data(), buffer.size(), 60, 8));
    EXPECT_FALSE(adapter_.encrypt(buffer.data(), buffer.size(), 65, 1));
    EXPECT_FALSE(adapter_.encryptZeroCopy(buffer.data(), buffer.size(), 32, 33));
    EXPECT_FALSE(adapter_.decrypt(buffer.data(), buffer.size(), SIZE_MAX, 2));
    EXPECT_FALSE(adapter_.decryptZeroCopy(buffer.data(), buffer.size(), 1, SIZE_MAX));
    EXPECT_EQ(buffer, original);

    EXPECT_TRUE(BufferAdapter::isValidRegion(buffer.data(), 64, 0, 64));
    EXPECT_TRUE(BufferAdapter::isValidRegion(buffer.data(), 64, 63, 1));
}

TEST_F(BufferAdapterTest, TransformsOnlyTheRegion) {
    std::vector<uint8_t> buffer = randomBytes(128);
    const std::vector<uint8_t> original = buffer;

    ASSERT_TRUE(adapter_.encrypt(buffer.data(), buffer.size(), 16, 32));

    std::vector<uint8_t> region(original.begin() + 16, original.begin() + 48);
    std::vector<uint8_t> expected = engine_.encryptBytes(region);

    EXPECT_TRUE(std::equal(original.begin(), original.begin() + 16, buffer.begin()));
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), buffer.begin() + 16));
    EXPECT_TRUE(std::equal(original.begin() + 48, original.end(), buffer.begin() + 48));

    ASSERT_TRUE(adapter_.decrypt(buffer.data(), buffer.size(), 16, 32));
    EXPECT_EQ(buffer, original);
}

TEST_F(BufferAdapterTest, CopyAndZeroCopyAgree) {
    std::vector<uint8_t> copied = randomBytes(4096, 5);
    std::vector<uint8_t> inPlace = copied;
    const std::vector<uint8_t> original = copied;

    ASSERT_TRUE(adapter_.encrypt(copied.data(), copied.size(), 100, 3000));
    ASSERT_TRUE(adapter_.encryptZeroCopy(inPlace.data(), inPlace.size(), 100, 3000));
    EXPECT_EQ(copied, inPlace);

    ASSERT_TRUE(adapter_.decryptZeroCopy(inPlace.data(), inPlace.size(), 100, 3000));
    EXPECT_EQ(inPlace, original);
}
