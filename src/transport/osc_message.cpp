#include "transport/osc_message.h"
#include "transport/endian.h"

#include <cstring>
#include <stdexcept>

namespace heatcast {
namespace osc {

namespace {

constexpr char kInt32TypeTag[] = ",i";

void appendPaddedString(std::vector<uint8_t>& buf, const std::string& s) {
    const size_t start = buf.size();
    buf.resize(start + paddedStringSize(s.size()), 0);
    std::memcpy(buf.data() + start, s.data(), s.size());
}

/// Reads a padded string starting at offset; advances offset past the padding.
bool readPaddedString(const uint8_t* data, size_t len, size_t& offset, std::string& out) {
    const size_t start = offset;
    size_t end = start;
    while (end < len && data[end] != 0) ++end;
    if (end >= len) return false;
    const size_t field = paddedStringSize(end - start);
    if (start + field > len) return false;
    for (size_t i = end; i < start + field; ++i) {
        if (data[i] != 0) return false;
    }
    out.assign(reinterpret_cast<const char*>(data + start), end - start);
    offset = start + field;
    return true;
}

}  // namespace

std::vector<uint8_t> encodeMessage(const Int32Message& msg) {
    if (msg.address.empty() || msg.address[0] != '/')
        throw std::invalid_argument("osc: address must start with '/': " + msg.address);

    std::vector<uint8_t> buf;
    buf.reserve(paddedStringSize(msg.address.size()) + paddedStringSize(2) + 4);
    appendPaddedString(buf, msg.address);
    appendPaddedString(buf, kInt32TypeTag);

    const size_t at = buf.size();
    buf.resize(at + 4);
    store32be(buf.data() + at, msg.value);
    return buf;
}

bool decodeMessage(const uint8_t* data, size_t len, Int32Message& out) {
    if (len % 4 != 0) return false;

    size_t offset = 0;
    std::string address, tags;
    if (!readPaddedString(data, len, offset, address)) return false;
    if (address.empty() || address[0] != '/') return false;
    if (!readPaddedString(data, len, offset, tags)) return false;
    if (tags != kInt32TypeTag) return false;
    if (offset + 4 != len) return false;

    out.address = address;
    out.value = load32be(data + offset);
    return true;
}

}  // namespace osc
}  // namespace heatcast
