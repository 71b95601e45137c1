#include "core/bit_rotation.hpp"
#include "core/rotation_tables.hpp"
#include <gtest/gtest.h>

using namespace xorblur;

TEST(BitRotationTest, RightUndoesLeftForEveryValueAndShift) {
    for (unsigned shift = 0; shift < 8; ++shift) {
        for (unsigned v = 0; v < 256; ++v) {
            uint8_t value = static_cast<uint8_t>(v);
            EXPECT_EQ(rotateRight8(rotateLeft8(value, shift), shift), value)
                << "value=" << v << " shift=" << shift;
            EXPECT_EQ(rotateLeft8(rotateRight8(value, shift), shift), value)
                << "value=" << v << " shift=" << shift;
        }
    }
}

TEST(BitRotationTest, ZeroShiftIsPassThrough) {
    for (unsigned v = 0; v < 256; ++v) {
        EXPECT_EQ(rotateLeft8(static_cast<uint8_t>(v), 0), v);
        EXPECT_EQ(rotateRight8(static_cast<uint8_t>(v), 0), v);
    }
}

TEST(BitRotationTest, KnownRotations) {
    EXPECT_EQ(rotateLeft8(0x81, 1), 0x03);
    EXPECT_EQ(rotateRight8(0x81, 1), 0xC0);
    EXPECT_EQ(rotateLeft8(0x63, 7), 0xB1);
    EXPECT_EQ(rotateLeft8(0x0F, 4), 0xF0);
    EXPECT_EQ(rotateRight8(0x01, 3), 0x20);
}

TEST(BitRotationTest, DynamicShiftWrapsModuloEight) {
    EXPECT_EQ(dynamicShift(0, 0), 0u);
    EXPECT_EQ(dynamicShift(7, 0), 7u);
    EXPECT_EQ(dynamicShift(8, 0), 0u);
    EXPECT_EQ(dynamicShift(0, 0x8F), 7u);
    EXPECT_EQ(dynamicShift(1, 0x8F), 0u);
    EXPECT_EQ(dynamicShift(3, 0xFF), 2u);
}

TEST(RotationTablesTest, MatchRuntimeRotation) {
    RotationTables tables;
    for (unsigned shift = 0; shift < 8; ++shift) {
        for (unsigned v = 0; v < 256; ++v) {
            uint8_t value = static_cast<uint8_t>(v);
            EXPECT_EQ(tables.left(shift, value), rotateLeft8(value, shift));
            EXPECT_EQ(tables.right(shift, value), rotateRight8(value, shift));
        }
    }
}
