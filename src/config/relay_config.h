#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace heatcast {

/// Process-wide settings. Built once in main() and treated as immutable.
struct RelayConfig {
    int         threshold_sec = 6;          // mean gap treated as zero intensity
    std::string keyword       = "#youtube";
    std::string osc_host      = "localhost";
    uint16_t    osc_port      = 8765;
    std::string osc_address   = "/calorie";
    std::string client_id     = "-";
    std::string client_secret = "-";

    // Fixed cadences and query shape; not exposed on the command line.
    std::chrono::milliseconds sample_interval{6000};
    std::chrono::milliseconds publish_interval{1000};
    int         search_count  = 100;
    std::string result_type   = "recent";

    /// Throws std::invalid_argument naming the first bad field.
    void validate() const;
};

enum class ParseStatus { OK, HELP };

/// Parse "--flag value" pairs over the defaults in config.
/// Returns HELP for --help/-h. Throws std::invalid_argument on unknown flags,
/// missing values, non-numeric or out-of-range numbers, or a config that
/// fails validate().
ParseStatus parseRelayArgs(int argc, const char* const argv[], RelayConfig& config);

void printRelayUsage(const char* prog);

}  // namespace heatcast
