#include "config/relay_config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace heatcast {

namespace {

long parseLong(const char* flag, const char* text) {
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE)
        throw std::invalid_argument(std::string(flag) + ": not an integer: " + text);
    return v;
}

}  // namespace

void RelayConfig::validate() const {
    if (threshold_sec <= 0)
        throw std::invalid_argument("threshold must be positive, got " + std::to_string(threshold_sec));
    if (keyword.empty())
        throw std::invalid_argument("keyword must not be empty");
    if (osc_host.empty())
        throw std::invalid_argument("osc host must not be empty");
    if (osc_port == 0)
        throw std::invalid_argument("osc port must be in 1..65535");
    if (osc_address.empty() || osc_address[0] != '/')
        throw std::invalid_argument("osc address must start with '/': " + osc_address);
    if (sample_interval.count() <= 0 || publish_interval.count() <= 0)
        throw std::invalid_argument("intervals must be positive");
    if (search_count <= 0)
        throw std::invalid_argument("search count must be positive");
}

void printRelayUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "Publish the posting intensity of a search keyword as OSC messages.\n\n"
        "  --threshold <n>       Mean gap in seconds treated as zero intensity (default: 6)\n"
        "  --keyword <s>         Search query (default: #youtube)\n"
        "  --osc-host <s>        OSC destination host (default: localhost)\n"
        "  --osc-port <n>        OSC destination port (default: 8765)\n"
        "  --osc-address <s>     OSC address pattern (default: /calorie)\n"
        "  --client-id <s>       API client id (default: -)\n"
        "  --client-secret <s>   API client secret (default: -)\n"
        "  --help                Show this help\n",
        prog);
}

ParseStatus parseRelayArgs(int argc, const char* const argv[], RelayConfig& config) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc)
                throw std::invalid_argument(std::string("missing value for ") + arg);
            return argv[++i];
        };

        if (std::strcmp(arg, "--threshold") == 0) {
            const long v = parseLong(arg, next());
            if (v <= 0 || v > std::numeric_limits<int>::max())
                throw std::invalid_argument("--threshold: out of range");
            config.threshold_sec = static_cast<int>(v);
        }
        else if (std::strcmp(arg, "--keyword") == 0)       config.keyword = next();
        else if (std::strcmp(arg, "--osc-host") == 0)      config.osc_host = next();
        else if (std::strcmp(arg, "--osc-port") == 0) {
            const long v = parseLong(arg, next());
            if (v < 1 || v > 65535)
                throw std::invalid_argument("--osc-port: out of range");
            config.osc_port = static_cast<uint16_t>(v);
        }
        else if (std::strcmp(arg, "--osc-address") == 0)   config.osc_address = next();
        else if (std::strcmp(arg, "--client-id") == 0)     config.client_id = next();
        else if (std::strcmp(arg, "--client-secret") == 0) config.client_secret = next();
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            return ParseStatus::HELP;
        } else {
            throw std::invalid_argument(std::string("unknown argument: ") + arg);
        }
    }

    config.validate();
    return ParseStatus::OK;
}

}  // namespace heatcast
