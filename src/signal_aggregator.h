#pragma once
#include "signal_store.h"
#include "types.h"
#include <map>
#include <string>
#include <vector>

namespace beacontrack {

const uint32_t AGGREGATE_MIN_SAMPLES = 2;
const double IQR_FENCE = 1.5;

float percentile(const std::vector<float> &sorted, double p);
float medianOf(const std::vector<float> &sorted);

// Tukey fences on the raw samples, median of what survives.
bool computeRobustRssi(const std::vector<float> &values, float &robustRssi,
                       uint32_t &kept, uint32_t &rejected);

// Gateways with fewer than AGGREGATE_MIN_SAMPLES samples are left out.
std::map<std::string, AggregatedSignal> aggregateSignals(const std::vector<RawSignal> &signals,
                                                         const std::string &beaconId,
                                                         uint64_t nowMs, uint32_t windowMs);

std::map<std::string, AggregatedSignal> aggregate(const SignalStore &store, const std::string &beaconId,
                                                  uint64_t nowMs, uint32_t windowMs, uint64_t maxSequence);

}  // namespace beacontrack
