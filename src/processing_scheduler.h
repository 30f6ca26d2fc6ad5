#pragma once
#include "config.h"
#include "message_bus.h"
#include "position_estimator.h"
#include "record_store.h"
#include "signal_store.h"
#include "site_registry.h"
#include "stats.h"
#include "temporal_smoother.h"
#include "zone_engine.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace beacontrack {

enum SchedulerState { SCHEDULER_STOPPED, SCHEDULER_RUNNING };

struct TickReport {
    uint32_t beaconsEvaluated;
    uint32_t positionsUpdated;
    uint32_t alertsRaised;
    uint32_t insufficient;
    uint32_t failures;
    bool aborted;
};

// Outcome of one beacon's pass through the pipeline
enum BeaconOutcome {
    BEACON_UPDATED,
    BEACON_INSUFFICIENT,
    BEACON_ABORTED
};

// Drives aggregate -> distance -> estimate -> smooth -> zones for every
// beacon with signals newer than the previous tick. Beacons are processed
// in parallel; each beacon's state is only touched under its own slot lock.
class ProcessingScheduler {
private:
    PipelineConfig config;
    PathLossConfig pathLossConfig;
    EstimatorConfig estimatorConfig;
    std::string positionsTopic;
    std::string alertsTopic;

    SiteRegistry &registry;
    SignalStore &store;
    TemporalSmoother &smoother;
    ZoneEngine &zones;
    RecordStore *records;
    OutboundPublisher *publisher;
    PipelineStats &stats;

    std::mutex tickMutex;
    uint64_t lastProcessedSequence;

    std::atomic<bool> stopFlag;
    std::atomic<int> state;
    std::thread loopThread;
    std::mutex loopMutex;
    std::condition_variable loopWake;
    std::condition_variable tickDone;
    bool tickInFlight;

    std::mutex warnMutex;
    std::set<std::string> uncalibratedWarned;

    void schedulerTask();
    void noteMissingCalibration(const std::string &gatewayId, CalibrationSource source);
    void emit(const SmoothedPosition &position, const std::vector<ZoneAlertEvent> &alerts);

public:
    ProcessingScheduler(const PipelineConfig &config, const IoConfig &io, SiteRegistry &registry,
                        SignalStore &store, TemporalSmoother &smoother, ZoneEngine &zones,
                        RecordStore *records, OutboundPublisher *publisher, PipelineStats &stats);
    ~ProcessingScheduler();

    // Gateway distances for one beacon: best floor only, implausible
    // distances dropped unless nothing would remain.
    bool collectDistances(const std::string &beaconId, uint64_t nowMs, uint64_t maxSequence,
                          std::string &floorId, std::vector<GatewayDistance> &out);

    BeaconOutcome processBeacon(const std::string &beaconId, uint64_t nowMs, uint64_t maxSequence);

    // One full cycle at time nowMs. Signals appended after the cut taken at
    // the start of the tick wait for the next one.
    TickReport tick(uint64_t nowMs);

    void start();
    // Stops the loop; an in-flight tick drops its unstarted beacons and is
    // given stopGraceMs to finish the ones already running.
    void stop();
    SchedulerState getState() const { return (SchedulerState)state.load(); }
};

}  // namespace beacontrack
