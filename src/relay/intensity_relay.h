#pragma once

#include "config/relay_config.h"
#include "model/intensity_estimator.h"
#include "relay/publisher_loop.h"
#include "relay/sampler_loop.h"
#include "runtime/cancellation.h"
#include "runtime/periodic_loop.h"
#include "source/i_event_source.h"
#include "state/intensity_cell.h"
#include "transport/i_osc_transport.h"

namespace heatcast {

/// Wires the sampling and publishing sides together.
///
///   source -> SamplerLoop -> IntensityCell -> PublisherLoop -> transport
///
/// Each side runs on its own PeriodicLoop thread at its own cadence
/// (config.sample_interval / config.publish_interval); the cell is the only
/// state they share. Both loops stop when the token passed to start() is
/// cancelled. Source and transport are borrowed and must outlive the relay.
class IntensityRelay {
public:
    IntensityRelay(const RelayConfig& config, IEventSource& source, IOscTransport& transport);

    /// Joins both loops; the start() token must already be cancelled.
    ~IntensityRelay();

    IntensityRelay(const IntensityRelay&) = delete;
    IntensityRelay& operator=(const IntensityRelay&) = delete;

    void start(const CancellationToken& token);

    /// Wait for both loops to exit after cancellation.
    void join();

    const IntensityCell& cell() const { return cell_; }
    const SamplerLoop& sampler() const { return sampler_; }
    const PublisherLoop& publisher() const { return publisher_; }
    const PeriodicLoop& sampleLoop() const { return sample_loop_; }
    const PeriodicLoop& publishLoop() const { return publish_loop_; }

private:
    RelayConfig config_;
    IntensityEstimator estimator_;
    IntensityCell cell_;
    SamplerLoop sampler_;
    PublisherLoop publisher_;
    // Declared last so their threads are joined before anything they touch
    // is destroyed.
    PeriodicLoop sample_loop_;
    PeriodicLoop publish_loop_;
};

}  // namespace heatcast
