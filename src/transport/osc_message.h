#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace heatcast {
namespace osc {

/// OSC 1.0 message carrying a single int32 argument.
///
/// Wire layout (every field padded with NULs to a 4-byte boundary):
///   address pattern  "/calorie\0" + pad
///   type tag string  ",i\0\0"
///   argument         int32 big-endian
struct Int32Message {
    std::string address;
    int32_t value = 0;
};

/// Size of an OSC string field: the bytes, a NUL, then padding to 4.
inline size_t paddedStringSize(size_t len) { return (len + 4) & ~static_cast<size_t>(3); }

/// Throws std::invalid_argument if the address does not start with '/'.
std::vector<uint8_t> encodeMessage(const Int32Message& msg);

/// Parse a datagram produced by encodeMessage(). Returns false on any
/// layout mismatch (truncation, bad padding, type tag other than ",i").
bool decodeMessage(const uint8_t* data, size_t len, Int32Message& out);

}  // namespace osc
}  // namespace heatcast
