#include "snowcity/core/position.hpp"

namespace snowcity {

// CellPos packing: x in the upper 32 bits, z in the lower 32 bits.
// Both are stored as their unsigned two's complement bit pattern, so every
// distinct cell in the int32 range gets a distinct key.

uint64_t CellPos::pack() const {
    uint64_t px = static_cast<uint64_t>(static_cast<uint32_t>(x));
    uint64_t pz = static_cast<uint64_t>(static_cast<uint32_t>(z));
    return (px << 32) | pz;
}

}  // namespace snowcity
