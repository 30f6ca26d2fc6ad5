#pragma once
#include "types.h"
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace beacontrack {

const size_t MAX_SIGNALS_PER_BEACON = 2000;

// Append-only raw RSSI buffer shared by the ingest task and the scheduler.
// Every append gets a sequence number; readers pass the sequence captured at
// tick start so signals arriving mid-tick wait for the next tick.
class SignalStore {
private:
    mutable std::mutex storeMutex;
    std::map<std::string, std::deque<RawSignal>> signals;
    std::map<std::string, uint64_t> lastSequence;
    uint64_t nextSequence;
    size_t maxPerBeacon;

public:
    explicit SignalStore(size_t maxPerBeacon = MAX_SIGNALS_PER_BEACON);

    uint64_t append(const RawSignal &signal);
    uint64_t currentSequence() const;

    std::vector<RawSignal> snapshot(const std::string &beaconId, uint64_t fromMs, uint64_t toMs,
                                    uint64_t maxSequence) const;
    std::vector<std::string> beaconsUpdatedSince(uint64_t afterSequence, uint64_t upToSequence) const;

    size_t purgeOlderThan(uint64_t cutoffMs);
    size_t size() const;
};

}  // namespace beacontrack
