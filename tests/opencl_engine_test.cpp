#include "engines/blur/blur_opencl.hpp"
#include "engines/blur/blur_direct.hpp"
#include "test_data.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace xorblur;
using xorblur::fixtures::randomBytes;
using xorblur::fixtures::representativeKeys;

TEST(OpenCLEngineTest, MatchesDirectWhetherOrNotDeviceIsPresent) {
    for (const auto& key : representativeKeys()) {
        BlurOpenCLEngine engine(key);
        engine.initialize();
        BlurDirectEngine reference(key);

        for (size_t size : {1u, 13u, 4096u, 100003u}) {
            std::vector<uint8_t> data = randomBytes(size, static_cast<uint32_t>(size));
            std::vector<uint8_t> encrypted = engine.encryptBytes(data);
            EXPECT_EQ(encrypted, reference.encryptBytes(data))
                << "size=" << size << " available=" << engine.isAvailable();
            EXPECT_EQ(engine.decryptBytes(encrypted), data);
        }
        engine.cleanup();
    }
}

TEST(OpenCLEngineTest, InPlaceAndEmptyInput) {
    BlurOpenCLEngine engine(KeyMaterial::dynamic(DEFAULT_SECRET_KEY, DEFAULT_KEY_SEGMENT));
    std::vector<uint8_t> empty;
    engine.encryptInPlace(empty);
    EXPECT_TRUE(empty.empty());

    std::vector<uint8_t> data = randomBytes(5000);
    const std::vector<uint8_t> original = data;
    engine.encryptInPlace(data);
    engine.decryptInPlace(data);
    EXPECT_EQ(data, original);
}

TEST(OpenCLEngineTest, ReportsIdentity) {
    BlurOpenCLEngine engine(KeyMaterial::fixed(0x01, 1), true);
    EXPECT_EQ(engine.getStrategy(), Strategy::OpenCL);
    EXPECT_EQ(engine.getEngineName(), "OpenCL");
    EXPECT_TRUE(engine.isParallel());
    EXPECT_EQ(engine.getKeyMaterial(), KeyMaterial::fixed(0x01, 1));
}

TEST(OpenCLEngineTest, RepeatedInitializeAndCleanup) {
    KeyMaterial key = KeyMaterial::dynamic(DEFAULT_SECRET_KEY, DEFAULT_KEY_SEGMENT);
    BlurOpenCLEngine engine(key);
    BlurDirectEngine reference(key);
    std::vector<uint8_t> data = randomBytes(2048, 11);

    for (int round = 0; round < 3; ++round) {
        engine.initialize();
        EXPECT_EQ(engine.encryptBytes(data), reference.encryptBytes(data)) << "round " << round;
        engine.cleanup();
    }
    EXPECT_EQ(engine.decryptBytes(reference.encryptBytes(data)), data);
}
