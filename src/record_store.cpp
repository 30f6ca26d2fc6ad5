#include "record_store.h"
#include "log.h"
#include "message_codec.h"

namespace beacontrack {

template <typename T>
static void pushBounded(std::deque<T> &buffer, const T &value, size_t capacity) {
    if (buffer.size() >= capacity) buffer.pop_front();
    buffer.push_back(value);
}

MemoryRecordStore::MemoryRecordStore(size_t capacity) : capacity(capacity > 0 ? capacity : 1) {}

bool MemoryRecordStore::appendEstimate(const PositionEstimate &estimate) {
    std::lock_guard<std::mutex> lock(recordMutex);
    pushBounded(estimates, estimate, capacity);
    return true;
}

bool MemoryRecordStore::appendPosition(const SmoothedPosition &position) {
    std::lock_guard<std::mutex> lock(recordMutex);
    pushBounded(positions, position, capacity);
    return true;
}

bool MemoryRecordStore::appendAlert(const ZoneAlertEvent &alert) {
    std::lock_guard<std::mutex> lock(recordMutex);
    pushBounded(alerts, alert, capacity);
    return true;
}

bool MemoryRecordStore::appendRawSignal(const RawSignal &signal) {
    std::lock_guard<std::mutex> lock(recordMutex);
    pushBounded(rawSignals, signal, capacity);
    return true;
}

std::vector<RawSignal> MemoryRecordStore::queryRawSignals(const std::string &beaconId, uint64_t fromMs,
                                                          uint64_t toMs) const {
    std::lock_guard<std::mutex> lock(recordMutex);
    std::vector<RawSignal> out;
    for (const auto &signal : rawSignals) {
        if (signal.beaconId == beaconId && signal.observedAtMs >= fromMs && signal.observedAtMs <= toMs) {
            out.push_back(signal);
        }
    }
    return out;
}

std::vector<PositionEstimate> MemoryRecordStore::queryEstimates(const std::string &beaconId, uint64_t fromMs,
                                                                uint64_t toMs) const {
    std::lock_guard<std::mutex> lock(recordMutex);
    std::vector<PositionEstimate> out;
    for (const auto &estimate : estimates) {
        if (estimate.beaconId == beaconId && estimate.computedAtMs >= fromMs && estimate.computedAtMs <= toMs) {
            out.push_back(estimate);
        }
    }
    return out;
}

std::vector<SmoothedPosition> MemoryRecordStore::queryPositions(const std::string &beaconId, uint64_t fromMs,
                                                                uint64_t toMs) const {
    std::lock_guard<std::mutex> lock(recordMutex);
    std::vector<SmoothedPosition> out;
    for (const auto &position : positions) {
        if (position.beaconId == beaconId && position.updatedAtMs >= fromMs && position.updatedAtMs <= toMs) {
            out.push_back(position);
        }
    }
    return out;
}

std::vector<ZoneAlertEvent> MemoryRecordStore::unacknowledgedAlerts() const {
    std::lock_guard<std::mutex> lock(recordMutex);
    std::vector<ZoneAlertEvent> out;
    for (const auto &alert : alerts) {
        if (!alert.acknowledged) out.push_back(alert);
    }
    return out;
}

bool MemoryRecordStore::acknowledgeAlert(uint64_t alertId) {
    std::lock_guard<std::mutex> lock(recordMutex);
    for (auto &alert : alerts) {
        if (alert.id == alertId) {
            alert.acknowledged = true;
            return true;
        }
    }
    return false;
}

JsonlRecordStore::JsonlRecordStore(const std::string &path, size_t capacity)
    : MemoryRecordStore(capacity), path(path), file(nullptr) {}

JsonlRecordStore::~JsonlRecordStore() {
    close();
}

bool JsonlRecordStore::open() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (file) return true;
    file = fopen(path.c_str(), "a");
    if (!file) {
        logPrintf("[STORE] Failed to open history file '%s'\n", path.c_str());
        return false;
    }
    logPrintf("[STORE] Appending history to %s\n", path.c_str());
    return true;
}

void JsonlRecordStore::close() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (file) {
        fclose(file);
        file = nullptr;
    }
}

bool JsonlRecordStore::writeLine(const std::string &line) {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (!file) return false;
    if (fputs(line.c_str(), file) < 0 || fputc('\n', file) == EOF || fflush(file) != 0) {
        logPrintf("[STORE] Write to %s failed\n", path.c_str());
        return false;
    }
    return true;
}

bool JsonlRecordStore::appendEstimate(const PositionEstimate &estimate) {
    if (!MemoryRecordStore::appendEstimate(estimate)) return false;
    return writeLine(encodeEstimateRecord(estimate));
}

bool JsonlRecordStore::appendPosition(const SmoothedPosition &position) {
    if (!MemoryRecordStore::appendPosition(position)) return false;
    return writeLine(encodePositionRecord(position));
}

bool JsonlRecordStore::appendAlert(const ZoneAlertEvent &alert) {
    if (!MemoryRecordStore::appendAlert(alert)) return false;
    return writeLine(encodeAlertRecord(alert));
}

bool JsonlRecordStore::acknowledgeAlert(uint64_t alertId) {
    ZoneAlertEvent acknowledged;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(recordMutex);
        for (auto &alert : alerts) {
            if (alert.id == alertId) {
                alert.acknowledged = true;
                acknowledged = alert;
                found = true;
                break;
            }
        }
    }
    if (!found) return false;
    // History is append-only; the acknowledgement is a new record
    return writeLine(encodeAlertRecord(acknowledged));
}

}  // namespace beacontrack
