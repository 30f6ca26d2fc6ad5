#include "signal_store.h"
#include <algorithm>

namespace beacontrack {

SignalStore::SignalStore(size_t maxPerBeacon) : nextSequence(1), maxPerBeacon(maxPerBeacon) {}

uint64_t SignalStore::append(const RawSignal &signal) {
    std::lock_guard<std::mutex> lock(storeMutex);

    RawSignal stored = signal;
    stored.sequence = nextSequence++;

    auto &buffer = signals[stored.beaconId];
    buffer.push_back(stored);
    if (buffer.size() > maxPerBeacon) {
        buffer.pop_front();
    }
    lastSequence[stored.beaconId] = stored.sequence;
    return stored.sequence;
}

uint64_t SignalStore::currentSequence() const {
    std::lock_guard<std::mutex> lock(storeMutex);
    return nextSequence - 1;
}

std::vector<RawSignal> SignalStore::snapshot(const std::string &beaconId, uint64_t fromMs, uint64_t toMs,
                                             uint64_t maxSequence) const {
    std::vector<RawSignal> out;
    std::lock_guard<std::mutex> lock(storeMutex);

    auto it = signals.find(beaconId);
    if (it == signals.end()) return out;

    for (const auto &signal : it->second) {
        if (signal.sequence > maxSequence) continue;
        if (signal.observedAtMs < fromMs || signal.observedAtMs > toMs) continue;
        out.push_back(signal);
    }
    return out;
}

std::vector<std::string> SignalStore::beaconsUpdatedSince(uint64_t afterSequence, uint64_t upToSequence) const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(storeMutex);

    for (const auto &entry : lastSequence) {
        if (entry.second > afterSequence && entry.second <= upToSequence) {
            out.push_back(entry.first);
            continue;
        }
        // A later append may have moved lastSequence past the cut while an
        // earlier one is still inside (afterSequence, upToSequence].
        if (entry.second > upToSequence) {
            auto it = signals.find(entry.first);
            if (it == signals.end()) continue;
            for (const auto &signal : it->second) {
                if (signal.sequence > afterSequence && signal.sequence <= upToSequence) {
                    out.push_back(entry.first);
                    break;
                }
            }
        }
    }
    return out;
}

size_t SignalStore::purgeOlderThan(uint64_t cutoffMs) {
    std::lock_guard<std::mutex> lock(storeMutex);
    size_t removed = 0;

    for (auto it = signals.begin(); it != signals.end();) {
        auto &buffer = it->second;
        size_t before = buffer.size();
        buffer.erase(std::remove_if(buffer.begin(), buffer.end(),
                                    [cutoffMs](const RawSignal &s) { return s.observedAtMs < cutoffMs; }),
                     buffer.end());
        removed += before - buffer.size();

        if (buffer.empty()) {
            lastSequence.erase(it->first);
            it = signals.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SignalStore::size() const {
    std::lock_guard<std::mutex> lock(storeMutex);
    size_t total = 0;
    for (const auto &entry : signals) total += entry.second.size();
    return total;
}

}  // namespace beacontrack
