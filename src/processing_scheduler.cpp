#include "processing_scheduler.h"
#include "log.h"
#include "message_codec.h"
#include "path_loss.h"
#include "signal_aggregator.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <map>

namespace beacontrack {

ProcessingScheduler::ProcessingScheduler(const PipelineConfig &config, const IoConfig &io, SiteRegistry &registry,
                                         SignalStore &store, TemporalSmoother &smoother, ZoneEngine &zones,
                                         RecordStore *records, OutboundPublisher *publisher, PipelineStats &stats)
    : config(config),
      pathLossConfig(toPathLossConfig(config)),
      estimatorConfig(toEstimatorConfig(config)),
      positionsTopic(io.positionsTopic),
      alertsTopic(io.alertsTopic),
      registry(registry),
      store(store),
      smoother(smoother),
      zones(zones),
      records(records),
      publisher(publisher),
      stats(stats),
      lastProcessedSequence(0),
      stopFlag(false),
      state(SCHEDULER_STOPPED),
      tickInFlight(false) {}

ProcessingScheduler::~ProcessingScheduler() {
    stop();
}

void ProcessingScheduler::noteMissingCalibration(const std::string &gatewayId, CalibrationSource source) {
    stats.missingCalibration++;

    std::lock_guard<std::mutex> lock(warnMutex);
    if (uncalibratedWarned.insert(gatewayId).second) {
        logPrintf("[PATH_LOSS] Gateway %s uncalibrated, using %s reference power\n", gatewayId.c_str(),
                  source == CALIBRATION_PARTIAL      ? "configured"
                  : source == CALIBRATION_ADVERTISED ? "advertised"
                                                     : "default");
    }
}

bool ProcessingScheduler::collectDistances(const std::string &beaconId, uint64_t nowMs, uint64_t maxSequence,
                                           std::string &floorId, std::vector<GatewayDistance> &out) {
    std::map<std::string, AggregatedSignal> signals = aggregate(store, beaconId, nowMs, config.windowMs, maxSequence);

    std::map<std::string, std::vector<GatewayDistance>> byFloor;
    for (const auto &entry : signals) {
        Gateway gateway;
        if (!registry.findGateway(entry.first, gateway)) continue;

        PathLossCalibration cal;
        CalibrationSource source = resolveCalibration(gateway, entry.second, pathLossConfig, cal);
        if (source != CALIBRATION_GATEWAY) noteMissingCalibration(gateway.id, source);

        GatewayDistance gd;
        gd.gatewayId = gateway.id;
        gd.x = gateway.x;
        gd.y = gateway.y;
        gd.distance = rssiToDistance(cal, entry.second.robustRssi, pathLossConfig);
        byFloor[gateway.floorId].push_back(gd);
    }
    if (byFloor.empty()) return false;

    // Most gateways wins; map order makes the lowest id win ties
    auto best = byFloor.begin();
    for (auto it = byFloor.begin(); it != byFloor.end(); ++it) {
        if (it->second.size() > best->second.size()) best = it;
    }
    floorId = best->first;

    std::vector<GatewayDistance> usable;
    for (const auto &gd : best->second) {
        if (gd.distance <= config.maxUsableDistance) usable.push_back(gd);
    }
    out = usable.empty() ? best->second : usable;
    return true;
}

BeaconOutcome ProcessingScheduler::processBeacon(const std::string &beaconId, uint64_t nowMs, uint64_t maxSequence) {
    std::string floorId;
    std::vector<GatewayDistance> distances;
    if (!collectDistances(beaconId, nowMs, maxSequence, floorId, distances)) {
        stats.insufficientGateways++;
        return BEACON_INSUFFICIENT;
    }

    PositionEstimate estimate;
    EstimateStatus status = estimatePosition(beaconId, distances, estimatorConfig, estimate);
    estimate.floorId = floorId;
    estimate.computedAtMs = nowMs;

    switch (status) {
        case ESTIMATE_INSUFFICIENT:
            stats.insufficientGateways++;
            logPrintf("[ESTIMATE] %s: %u gateway(s), position not advanced\n", beaconId.c_str(),
                      (unsigned)distances.size());
            return BEACON_INSUFFICIENT;
        case ESTIMATE_DEGENERATE:
            stats.degenerateGeometry++;
            logPrintf("[ESTIMATE] %s: degenerate geometry, accuracy %.2f\n", beaconId.c_str(), estimate.accuracy);
            break;
        case ESTIMATE_NOT_CONVERGED:
            stats.nonConvergence++;
            logPrintf("[ESTIMATE] %s: no convergence after %u iterations\n", beaconId.c_str(), estimate.iterations);
            break;
        case ESTIMATE_OK:
            break;
    }

    if (stopFlag.load()) return BEACON_ABORTED;

    if (records && !records->appendEstimate(estimate)) stats.errors++;

    SmoothedPosition smoothed = smoother.update(beaconId, estimate);
    std::vector<ZoneAlertEvent> alerts = zones.evaluate(beaconId, smoothed, nowMs);

    stats.positionsCalculated++;
    stats.alertsRaised += (uint32_t)alerts.size();
    emit(smoothed, alerts);
    return BEACON_UPDATED;
}

void ProcessingScheduler::emit(const SmoothedPosition &position, const std::vector<ZoneAlertEvent> &alerts) {
    if (records) {
        if (!records->appendPosition(position)) stats.errors++;
        for (const auto &alert : alerts) {
            if (!records->appendAlert(alert)) stats.errors++;
        }
    }
    if (!publisher) return;

    Beacon beacon;
    Floor floor;
    if (!registry.findBeacon(position.beaconId, beacon) || !registry.findFloor(position.floorId, floor)) {
        stats.errors++;
        logPrintf("[PUBLISH] No beacon/floor for %s, not published\n", position.beaconId.c_str());
        return;
    }

    OutboundMessage message;
    message.kind = MESSAGE_POSITION;
    message.topic = positionTopic(positionsTopic, beacon);
    message.payload = encodePositionMessage(beacon, floor, position);
    publisher->enqueue(message);

    for (const auto &alert : alerts) {
        const Zone *zone = zones.findZone(alert.zoneId);
        if (!zone) continue;
        Floor zoneFloor = floor;
        if (zone->floorId != floor.id && !registry.findFloor(zone->floorId, zoneFloor)) continue;

        message.kind = MESSAGE_ALERT;
        message.topic = alertTopic(alertsTopic, alert);
        message.payload = encodeAlertMessage(beacon, *zone, zoneFloor, alert);
        publisher->enqueue(message);
    }
}

TickReport ProcessingScheduler::tick(uint64_t nowMs) {
    std::lock_guard<std::mutex> tickLock(tickMutex);
    {
        std::lock_guard<std::mutex> lock(loopMutex);
        tickInFlight = true;
    }

    TickReport report = {};
    uint64_t cut = store.currentSequence();
    std::vector<std::string> beacons = store.beaconsUpdatedSince(lastProcessedSequence, cut);

    std::atomic<size_t> next(0);
    std::atomic<uint32_t> updated(0), insufficient(0), failures(0), evaluated(0);
    uint32_t raisedBefore = stats.alertsRaised.load();

    auto worker = [&]() {
        for (;;) {
            if (stopFlag.load()) return;
            size_t index = next++;
            if (index >= beacons.size()) return;

            const std::string &beaconId = beacons[index];
            evaluated++;
            try {
                switch (processBeacon(beaconId, nowMs, cut)) {
                    case BEACON_UPDATED:      updated++; break;
                    case BEACON_INSUFFICIENT: insufficient++; break;
                    case BEACON_ABORTED:      break;
                }
            } catch (const std::exception &e) {
                // One bad beacon must not take the tick down with it
                failures++;
                stats.errors++;
                logPrintf("[SCHED] Beacon %s failed: %s\n", beaconId.c_str(), e.what());
            }
        }
    };

    size_t workerCount = std::min<size_t>(config.workerThreads, beacons.size());
    if (workerCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        for (size_t i = 0; i < workerCount; i++) workers.emplace_back(worker);
        for (auto &t : workers) t.join();
    }

    report.beaconsEvaluated = evaluated.load();
    report.positionsUpdated = updated.load();
    report.insufficient = insufficient.load();
    report.failures = failures.load();
    report.alertsRaised = stats.alertsRaised.load() - raisedBefore;
    // Beacons that were never claimed, or claimed and then dropped on stop
    report.aborted = updated.load() + insufficient.load() + failures.load() < beacons.size();

    // An aborted tick leaves its beacons for the next start
    if (!report.aborted) lastProcessedSequence = cut;

    if (nowMs > config.retentionMs) {
        size_t purged = store.purgeOlderThan(nowMs - config.retentionMs);
        if (purged > 0) logPrintf("[STORE] Purged %u signals\n", (unsigned)purged);
    }

    stats.ticks++;
    stats.beaconsEvaluated += report.beaconsEvaluated;
    stats.alertsSuppressed = zones.getSuppressedCount();

    if (report.beaconsEvaluated > 0) {
        logPrintf("[SCHED] Tick: %u beacons, %u updated, %u insufficient, %u alerts%s\n",
                  report.beaconsEvaluated, report.positionsUpdated, report.insufficient, report.alertsRaised,
                  report.aborted ? " (aborted)" : "");
    }

    {
        std::lock_guard<std::mutex> lock(loopMutex);
        tickInFlight = false;
    }
    tickDone.notify_all();
    return report;
}

void ProcessingScheduler::schedulerTask() {
    logPrintf("[SCHED] Running, tick every %u ms\n", (unsigned)config.tickPeriodMs);
    while (!stopFlag.load()) {
        tick(nowMillis());

        std::unique_lock<std::mutex> lock(loopMutex);
        loopWake.wait_for(lock, std::chrono::milliseconds(config.tickPeriodMs), [this] { return stopFlag.load(); });
    }
}

void ProcessingScheduler::start() {
    int expected = SCHEDULER_STOPPED;
    if (!state.compare_exchange_strong(expected, SCHEDULER_RUNNING)) return;

    stopFlag = false;
    loopThread = std::thread(&ProcessingScheduler::schedulerTask, this);
}

void ProcessingScheduler::stop() {
    if (state.load() != SCHEDULER_RUNNING) return;

    {
        std::unique_lock<std::mutex> lock(loopMutex);
        stopFlag = true;
        loopWake.notify_all();
        if (!tickDone.wait_for(lock, std::chrono::milliseconds(config.stopGraceMs), [this] { return !tickInFlight; })) {
            logPrintf("[SCHED] WARNING: in-flight tick exceeded %u ms grace period\n", (unsigned)config.stopGraceMs);
        }
    }

    if (loopThread.joinable()) loopThread.join();
    stopFlag = false;
    state = SCHEDULER_STOPPED;
    logPrintf("[SCHED] Stopped\n");
}

}  // namespace beacontrack
