#pragma once

#include <array>
#include <cstdint>

namespace xorblur {

// Precomputed 8-bit rotations indexed by [shift][value].
class RotationTables {
public:
    RotationTables();

    uint8_t left(unsigned shift, uint8_t value) const { return left_[shift][value]; }
    uint8_t right(unsigned shift, uint8_t value) const { return right_[shift][value]; }

    const std::array<uint8_t, 256>& leftRow(unsigned shift) const { return left_[shift]; }
    const std::array<uint8_t, 256>& rightRow(unsigned shift) const { return right_[shift]; }

private:
    std::array<std::array<uint8_t, 256>, 8> left_;
    std::array<std::array<uint8_t, 256>, 8> right_;
};

}
