#pragma once
#include "message_codec.h"
#include "record_store.h"
#include "signal_store.h"
#include "site_registry.h"
#include "stats.h"
#include <string>

namespace beacontrack {

enum IngestResult {
    INGEST_STORED,
    INGEST_UNRESOLVED_GATEWAY,
    INGEST_UNRESOLVED_BEACON,
    INGEST_INVALID
};

const char *ingestResultName(IngestResult result);

// Resolves MACs to registry ids and appends to the SignalStore. Never blocks
// on the processing cycle beyond the store's append lock.
class Ingestor {
private:
    SiteRegistry &registry;
    SignalStore &store;
    RecordStore *records;
    PipelineStats &stats;
    bool autoDiscover;

public:
    Ingestor(SiteRegistry &registry, SignalStore &store, RecordStore *records, PipelineStats &stats,
             bool autoDiscover);

    IngestResult ingest(const GatewayReading &reading, uint64_t receivedAtMs);

    // Decodes one inbound line and ingests every reading in it. Returns the
    // number of readings stored.
    size_t ingestLine(const std::string &line, uint64_t receivedAtMs);
};

}  // namespace beacontrack
