#include "ingestion.h"
#include "log.h"
#include <vector>

namespace beacontrack {

// Readings stamped further ahead than this are treated as clock skew
static const uint64_t MAX_FUTURE_SKEW_MS = 60000;

const char *ingestResultName(IngestResult result) {
    switch (result) {
        case INGEST_STORED:             return "stored";
        case INGEST_UNRESOLVED_GATEWAY: return "unresolved_gateway";
        case INGEST_UNRESOLVED_BEACON:  return "unresolved_beacon";
        case INGEST_INVALID:            return "invalid";
    }
    return "unknown";
}

Ingestor::Ingestor(SiteRegistry &registry, SignalStore &store, RecordStore *records, PipelineStats &stats,
                   bool autoDiscover)
    : registry(registry), store(store), records(records), stats(stats), autoDiscover(autoDiscover) {}

IngestResult Ingestor::ingest(const GatewayReading &reading, uint64_t receivedAtMs) {
    stats.signalsReceived++;

    if (reading.rssi > 0 || reading.gatewayMac.empty() || reading.beaconMac.empty()) {
        logPrintf("[INGEST] Invalid reading %s via %s rssi=%d\n", reading.beaconMac.c_str(),
                  reading.gatewayMac.c_str(), reading.rssi);
        return INGEST_INVALID;
    }

    Gateway gateway;
    if (!registry.findGatewayByMac(reading.gatewayMac, gateway)) {
        stats.unresolvedIdentity++;
        logPrintf("[INGEST] WARNING: unknown gateway %s, reading dropped\n", reading.gatewayMac.c_str());
        return INGEST_UNRESOLVED_GATEWAY;
    }

    Beacon beacon;
    if (!registry.findBeaconByMac(reading.beaconMac, beacon)) {
        if (!autoDiscover || !registry.discoverBeacon(reading.beaconMac, beacon)) {
            stats.unresolvedIdentity++;
            return INGEST_UNRESOLVED_BEACON;
        }
        stats.beaconsDiscovered++;
    }

    RawSignal signal;
    signal.beaconId = beacon.id;
    signal.gatewayId = gateway.id;
    signal.rssi = reading.rssi;
    signal.txPower = reading.txPower;
    signal.hasTxPower = reading.hasTxPower;
    signal.observedAtMs = reading.timestampMs > 0 ? reading.timestampMs : receivedAtMs;
    if (signal.observedAtMs > receivedAtMs + MAX_FUTURE_SKEW_MS) {
        signal.observedAtMs = receivedAtMs;
    }

    signal.sequence = store.append(signal);
    stats.signalsStored++;

    if (records && !records->appendRawSignal(signal)) {
        stats.errors++;
        logPrintf("[STORE] Raw signal history append failed for %s\n", beacon.id.c_str());
    }
    return INGEST_STORED;
}

size_t Ingestor::ingestLine(const std::string &line, uint64_t receivedAtMs) {
    std::vector<GatewayReading> readings;
    if (!decodeGatewayMessage(line, receivedAtMs, readings)) {
        stats.decodeErrors++;
        return 0;
    }

    size_t stored = 0;
    for (const auto &reading : readings) {
        if (ingest(reading, receivedAtMs) == INGEST_STORED) stored++;
    }
    return stored;
}

}  // namespace beacontrack
