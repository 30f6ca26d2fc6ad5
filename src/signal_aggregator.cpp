#include "signal_aggregator.h"
#include <algorithm>

namespace beacontrack {

// Linear interpolation between closest ranks
float percentile(const std::vector<float> &sorted, double p) {
    if (sorted.empty()) return 0.0f;
    if (sorted.size() == 1) return sorted[0];

    double rank = p * (sorted.size() - 1);
    size_t lo = (size_t)rank;
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = rank - lo;
    return (float)(sorted[lo] + (sorted[hi] - sorted[lo]) * frac);
}

float medianOf(const std::vector<float> &sorted) {
    return percentile(sorted, 0.5);
}

bool computeRobustRssi(const std::vector<float> &values, float &robustRssi,
                       uint32_t &kept, uint32_t &rejected) {
    kept = 0;
    rejected = 0;
    if (values.size() < AGGREGATE_MIN_SAMPLES) return false;

    std::vector<float> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    float q1 = percentile(sorted, 0.25);
    float q3 = percentile(sorted, 0.75);
    float iqr = q3 - q1;
    float lowFence = (float)(q1 - IQR_FENCE * iqr);
    float highFence = (float)(q3 + IQR_FENCE * iqr);

    std::vector<float> inliers;
    inliers.reserve(sorted.size());
    for (float v : sorted) {
        if (v >= lowFence && v <= highFence) {
            inliers.push_back(v);
        }
    }

    // Fences always contain Q1..Q3, so inliers is never empty
    kept = (uint32_t)inliers.size();
    rejected = (uint32_t)(sorted.size() - inliers.size());
    robustRssi = medianOf(inliers);
    return true;
}

std::map<std::string, AggregatedSignal> aggregateSignals(const std::vector<RawSignal> &signals,
                                                         const std::string &beaconId,
                                                         uint64_t nowMs, uint32_t windowMs) {
    uint64_t windowStart = nowMs > windowMs ? nowMs - windowMs : 0;

    std::map<std::string, std::vector<float>> rssiByGateway;
    std::map<std::string, std::vector<float>> txPowerByGateway;

    for (const auto &signal : signals) {
        if (signal.beaconId != beaconId) continue;
        if (signal.observedAtMs < windowStart || signal.observedAtMs > nowMs) continue;

        rssiByGateway[signal.gatewayId].push_back((float)signal.rssi);
        if (signal.hasTxPower) {
            txPowerByGateway[signal.gatewayId].push_back((float)signal.txPower);
        }
    }

    std::map<std::string, AggregatedSignal> out;
    for (const auto &entry : rssiByGateway) {
        AggregatedSignal agg;
        if (!computeRobustRssi(entry.second, agg.robustRssi, agg.sampleCount, agg.rejectedCount)) {
            continue;
        }

        agg.beaconId = beaconId;
        agg.gatewayId = entry.first;
        agg.windowStartMs = windowStart;
        agg.windowEndMs = nowMs;
        agg.hasTxPower = false;
        agg.txPower = 0.0f;

        auto tx = txPowerByGateway.find(entry.first);
        if (tx != txPowerByGateway.end()) {
            std::vector<float> sortedTx = tx->second;
            std::sort(sortedTx.begin(), sortedTx.end());
            agg.txPower = medianOf(sortedTx);
            agg.hasTxPower = true;
        }

        out[entry.first] = agg;
    }
    return out;
}

std::map<std::string, AggregatedSignal> aggregate(const SignalStore &store, const std::string &beaconId,
                                                  uint64_t nowMs, uint32_t windowMs, uint64_t maxSequence) {
    uint64_t windowStart = nowMs > windowMs ? nowMs - windowMs : 0;
    std::vector<RawSignal> window = store.snapshot(beaconId, windowStart, nowMs, maxSequence);
    return aggregateSignals(window, beaconId, nowMs, windowMs);
}

}  // namespace beacontrack
