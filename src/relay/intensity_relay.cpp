#include "relay/intensity_relay.h"

#include <cstdio>

namespace heatcast {

namespace {

SearchQuery makeQuery(const RelayConfig& config) {
    SearchQuery q;
    q.keyword = config.keyword;
    q.result_type = config.result_type;
    q.count = config.search_count;
    return q;
}

}  // namespace

IntensityRelay::IntensityRelay(const RelayConfig& config, IEventSource& source, IOscTransport& transport)
    : config_(config)
    , estimator_(config.threshold_sec)
    , sampler_(source, estimator_, cell_, makeQuery(config))
    , publisher_(cell_, transport, config.osc_address)
    , sample_loop_("SampleLoop", config.sample_interval, [this] { sampler_.tick(); })
    , publish_loop_("PublishLoop", config.publish_interval, [this] { publisher_.tick(); })
{}

IntensityRelay::~IntensityRelay() {
    join();
}

void IntensityRelay::start(const CancellationToken& token) {
    std::printf("IntensityRelay: starting keyword=%s sample=%lldms publish=%lldms -> %s:%u%s\n",
                config_.keyword.c_str(),
                static_cast<long long>(config_.sample_interval.count()),
                static_cast<long long>(config_.publish_interval.count()),
                config_.osc_host.c_str(), static_cast<unsigned>(config_.osc_port), config_.osc_address.c_str());
    publish_loop_.start(token);
    sample_loop_.start(token);
}

void IntensityRelay::join() {
    sample_loop_.join();
    publish_loop_.join();
}

}  // namespace heatcast
