#include "rotation_tables.hpp"
#include "bit_rotation.hpp"

namespace xorblur {

RotationTables::RotationTables() {
    for (unsigned shift = 0; shift < 8; ++shift) {
        for (unsigned value = 0; value < 256; ++value) {
            uint8_t b = static_cast<uint8_t>(value);
            left_[shift][value] = rotateLeft8(b, shift);
            right_[shift][value] = rotateRight8(b, shift);
        }
    }
}

}
