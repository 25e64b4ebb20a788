#include "config/relay_config.h"
#include "relay/intensity_relay.h"
#include "runtime/lifecycle_controller.h"
#include "source/twitter_search_source.h"
#include "transport/osc_udp_transport.h"

#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    heatcast::RelayConfig config;
    try {
        if (heatcast::parseRelayArgs(argc, argv, config) == heatcast::ParseStatus::HELP) {
            heatcast::printRelayUsage(argv[0]);
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "%s\n", e.what());
        heatcast::printRelayUsage(argv[0]);
        return 1;
    }

    std::printf("=== heatcast ===\n");
    std::printf("threshold=%d  keyword=%s  osc=%s:%u%s\n",
                config.threshold_sec, config.keyword.c_str(),
                config.osc_host.c_str(), static_cast<unsigned>(config.osc_port), config.osc_address.c_str());

    std::unique_ptr<heatcast::OscUdpTransport> transport;
    try {
        transport = std::make_unique<heatcast::OscUdpTransport>(config.osc_host, config.osc_port);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "heatcast: cannot open OSC transport: %s\n", e.what());
        return 1;
    }

    heatcast::TwitterSearchSource source(
        heatcast::TwitterCredentials{config.client_id, config.client_secret});

    heatcast::LifecycleController lifecycle;
    heatcast::LifecycleController::installSignalHandlers();

    heatcast::IntensityRelay relay(config, source, *transport);
    relay.start(lifecycle.token());

    lifecycle.waitForShutdown();
    relay.join();

    std::printf("heatcast: stopped (samples ok=%llu failed=%llu, messages sent=%llu failed=%llu)\n",
                static_cast<unsigned long long>(relay.sampler().count(heatcast::SampleOutcome::UPDATED)),
                static_cast<unsigned long long>(
                    relay.sampler().count(heatcast::SampleOutcome::SOURCE_ERROR) +
                    relay.sampler().count(heatcast::SampleOutcome::PARSE_ERROR) +
                    relay.sampler().count(heatcast::SampleOutcome::INSUFFICIENT_DATA)),
                static_cast<unsigned long long>(relay.publisher().count(heatcast::PublishOutcome::SENT)),
                static_cast<unsigned long long>(relay.publisher().count(heatcast::PublishOutcome::SEND_FAILED)));
    return 0;
}
