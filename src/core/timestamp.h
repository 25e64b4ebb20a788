#pragma once

#include <cstdint>
#include <string>

namespace heatcast {

/// Parse a source timestamp of the form "Wed Oct 10 20:19:24 +0000 2018"
/// into seconds since the Unix epoch (UTC). The numeric offset is honoured.
/// Throws TimestampParseError on malformed input.
int64_t parseCreatedAt(const std::string& text);

/// Inverse of parseCreatedAt, always rendered with a +0000 offset.
std::string formatCreatedAt(int64_t epoch_sec);

// Calendar helpers (exposed for testing)
int64_t daysFromCivil(int year, int month, int day);
void civilFromDays(int64_t days, int& year, int& month, int& day);

}  // namespace heatcast
