#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace beacontrack {

struct PipelineStats {
    std::atomic<uint32_t> signalsReceived{0};
    std::atomic<uint32_t> signalsStored{0};
    std::atomic<uint32_t> decodeErrors{0};
    std::atomic<uint32_t> inboundDropped{0};
    std::atomic<uint32_t> unresolvedIdentity{0};
    std::atomic<uint32_t> beaconsDiscovered{0};

    std::atomic<uint32_t> ticks{0};
    std::atomic<uint32_t> beaconsEvaluated{0};
    std::atomic<uint32_t> insufficientGateways{0};
    std::atomic<uint32_t> degenerateGeometry{0};
    std::atomic<uint32_t> nonConvergence{0};
    std::atomic<uint32_t> missingCalibration{0};
    std::atomic<uint32_t> positionsCalculated{0};

    std::atomic<uint32_t> alertsRaised{0};
    std::atomic<uint32_t> alertsSuppressed{0};

    std::atomic<uint32_t> positionsPublished{0};
    std::atomic<uint32_t> alertsPublished{0};
    std::atomic<uint32_t> outboundDropped{0};
    std::atomic<uint32_t> errors{0};
};

std::string getDiagnostics(const PipelineStats &stats);

}  // namespace beacontrack
