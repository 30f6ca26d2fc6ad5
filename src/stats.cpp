#include "stats.h"

namespace beacontrack {

static void appendCounter(std::string &out, const char *name, const std::atomic<uint32_t> &value) {
    out += "  ";
    out += name;
    out += ": ";
    out += std::to_string(value.load());
    out += "\n";
}

std::string getDiagnostics(const PipelineStats &stats) {
    std::string s = "=== Pipeline Diagnostics ===\n";

    s += "Ingest:\n";
    appendCounter(s, "signals received", stats.signalsReceived);
    appendCounter(s, "signals stored", stats.signalsStored);
    appendCounter(s, "decode errors", stats.decodeErrors);
    appendCounter(s, "inbound dropped", stats.inboundDropped);
    appendCounter(s, "unresolved identity", stats.unresolvedIdentity);
    appendCounter(s, "beacons discovered", stats.beaconsDiscovered);

    s += "Estimation:\n";
    appendCounter(s, "ticks", stats.ticks);
    appendCounter(s, "beacons evaluated", stats.beaconsEvaluated);
    appendCounter(s, "positions calculated", stats.positionsCalculated);
    appendCounter(s, "insufficient gateways", stats.insufficientGateways);
    appendCounter(s, "degenerate geometry", stats.degenerateGeometry);
    appendCounter(s, "non convergence", stats.nonConvergence);
    appendCounter(s, "missing calibration", stats.missingCalibration);

    s += "Zones:\n";
    appendCounter(s, "alerts raised", stats.alertsRaised);
    appendCounter(s, "alerts suppressed", stats.alertsSuppressed);

    s += "Publish:\n";
    appendCounter(s, "positions published", stats.positionsPublished);
    appendCounter(s, "alerts published", stats.alertsPublished);
    appendCounter(s, "outbound dropped", stats.outboundDropped);
    appendCounter(s, "errors", stats.errors);

    return s;
}

}  // namespace beacontrack
