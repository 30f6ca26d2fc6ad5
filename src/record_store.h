#pragma once
#include "types.h"
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace beacontrack {

#ifndef BEACONTRACK_HISTORY_CAPACITY
#define BEACONTRACK_HISTORY_CAPACITY 10000
#endif

// Persistence seam for raw estimates, committed positions, alerts and raw signals.
class RecordStore {
public:
    virtual ~RecordStore() {}

    virtual bool appendEstimate(const PositionEstimate &estimate) = 0;
    virtual bool appendPosition(const SmoothedPosition &position) = 0;
    virtual bool appendAlert(const ZoneAlertEvent &alert) = 0;
    virtual bool appendRawSignal(const RawSignal &signal) = 0;

    virtual std::vector<RawSignal> queryRawSignals(const std::string &beaconId, uint64_t fromMs,
                                                   uint64_t toMs) const = 0;
    virtual std::vector<PositionEstimate> queryEstimates(const std::string &beaconId, uint64_t fromMs,
                                                         uint64_t toMs) const = 0;
    virtual std::vector<SmoothedPosition> queryPositions(const std::string &beaconId, uint64_t fromMs,
                                                         uint64_t toMs) const = 0;
    virtual std::vector<ZoneAlertEvent> unacknowledgedAlerts() const = 0;
    virtual bool acknowledgeAlert(uint64_t alertId) = 0;
};

// Bounded in-memory history; the oldest record of each kind is evicted.
class MemoryRecordStore : public RecordStore {
protected:
    mutable std::mutex recordMutex;
    std::deque<PositionEstimate> estimates;
    std::deque<SmoothedPosition> positions;
    std::deque<ZoneAlertEvent> alerts;
    std::deque<RawSignal> rawSignals;
    size_t capacity;

public:
    explicit MemoryRecordStore(size_t capacity = BEACONTRACK_HISTORY_CAPACITY);

    bool appendEstimate(const PositionEstimate &estimate) override;
    bool appendPosition(const SmoothedPosition &position) override;
    bool appendAlert(const ZoneAlertEvent &alert) override;
    bool appendRawSignal(const RawSignal &signal) override;

    std::vector<RawSignal> queryRawSignals(const std::string &beaconId, uint64_t fromMs,
                                           uint64_t toMs) const override;
    std::vector<PositionEstimate> queryEstimates(const std::string &beaconId, uint64_t fromMs,
                                                 uint64_t toMs) const override;
    std::vector<SmoothedPosition> queryPositions(const std::string &beaconId, uint64_t fromMs,
                                                 uint64_t toMs) const override;
    std::vector<ZoneAlertEvent> unacknowledgedAlerts() const override;
    bool acknowledgeAlert(uint64_t alertId) override;
};

// MemoryRecordStore that also appends estimates, positions and alerts to a
// JSON-lines file.
class JsonlRecordStore : public MemoryRecordStore {
private:
    std::string path;
    FILE *file;
    std::mutex fileMutex;

    bool writeLine(const std::string &line);

public:
    JsonlRecordStore(const std::string &path, size_t capacity = BEACONTRACK_HISTORY_CAPACITY);
    ~JsonlRecordStore() override;

    JsonlRecordStore(const JsonlRecordStore &) = delete;
    JsonlRecordStore &operator=(const JsonlRecordStore &) = delete;

    bool open();
    void close();

    bool appendEstimate(const PositionEstimate &estimate) override;
    bool appendPosition(const SmoothedPosition &position) override;
    bool appendAlert(const ZoneAlertEvent &alert) override;
    bool acknowledgeAlert(uint64_t alertId) override;
};

}  // namespace beacontrack
