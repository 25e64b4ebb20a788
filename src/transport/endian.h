#pragma once

#include <cstdint>

namespace heatcast {
namespace osc {

/// OSC integers are 32-bit two's complement, big-endian. Byte order is built
/// with shifts so the result does not depend on the host.
inline void store32be(uint8_t* dst, int32_t val) {
    const uint32_t v = static_cast<uint32_t>(val);
    dst[0] = static_cast<uint8_t>(v >> 24);
    dst[1] = static_cast<uint8_t>(v >> 16);
    dst[2] = static_cast<uint8_t>(v >> 8);
    dst[3] = static_cast<uint8_t>(v);
}

inline int32_t load32be(const uint8_t* src) {
    const uint32_t v = (static_cast<uint32_t>(src[0]) << 24) |
                       (static_cast<uint32_t>(src[1]) << 16) |
                       (static_cast<uint32_t>(src[2]) << 8) |
                        static_cast<uint32_t>(src[3]);
    return static_cast<int32_t>(v);
}

}  // namespace osc
}  // namespace heatcast
