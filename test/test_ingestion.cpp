#include "ingestion.h"
#include "log.h"
#include <gtest/gtest.h>

using namespace beacontrack;

namespace {

class IngestionTest : public ::testing::Test {
protected:
    SiteRegistry registry;
    SignalStore store;
    MemoryRecordStore records;
    PipelineStats stats;

    void SetUp() override {
        setLogEnabled(false);

        Floor floor;
        floor.id = "f1";
        floor.name = "Ground";
        floor.width = 20;
        floor.height = 20;
        ASSERT_TRUE(registry.addFloor(floor));

        Gateway gw;
        gw.id = "gw-a";
        gw.mac = "AC:23:3F:A0:00:01";
        gw.floorId = "f1";
        gw.x = 1;
        gw.y = 1;
        gw.calibration.referencePower = -59;
        gw.calibration.pathLossExponent = 2;
        gw.calibration.calibrated = true;
        ASSERT_TRUE(registry.addGateway(gw));

        Beacon beacon;
        beacon.id = "pump-1";
        beacon.mac = "C3:00:00:1A:2B:3C";
        ASSERT_TRUE(registry.addBeacon(beacon));
    }
    void TearDown() override { setLogEnabled(true); }

    GatewayReading reading(const std::string &gatewayMac, const std::string &beaconMac, int rssi,
                           uint64_t timestampMs) {
        GatewayReading r;
        r.gatewayMac = gatewayMac;
        r.beaconMac = beaconMac;
        r.rssi = (int8_t)rssi;
        r.txPower = 0;
        r.hasTxPower = false;
        r.timestampMs = timestampMs;
        return r;
    }
};

}  // namespace

TEST_F(IngestionTest, StoresKnownReading) {
    Ingestor ingestor(registry, store, &records, stats, false);

    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:01", "C3:00:00:1A:2B:3C", -70, 5000), 6000), INGEST_STORED);

    std::vector<RawSignal> signals = store.snapshot("pump-1", 0, 10000, store.currentSequence());
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].gatewayId, "gw-a");
    EXPECT_EQ(signals[0].rssi, -70);
    EXPECT_EQ(signals[0].observedAtMs, 5000u);
    EXPECT_EQ(stats.signalsReceived.load(), 1u);
    EXPECT_EQ(stats.signalsStored.load(), 1u);

    std::vector<RawSignal> history = records.queryRawSignals("pump-1", 0, 10000);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].sequence, signals[0].sequence);
}

TEST_F(IngestionTest, UnknownGatewayIsDropped) {
    Ingestor ingestor(registry, store, &records, stats, true);

    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:99", "C3:00:00:1A:2B:3C", -70, 5000), 6000),
              INGEST_UNRESOLVED_GATEWAY);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(stats.unresolvedIdentity.load(), 1u);
}

TEST_F(IngestionTest, UnknownBeaconWithoutDiscovery) {
    Ingestor ingestor(registry, store, &records, stats, false);

    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:01", "AA:BB:CC:DD:EE:FF", -70, 5000), 6000),
              INGEST_UNRESOLVED_BEACON);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(registry.beaconCount(), 1u);
    EXPECT_EQ(stats.unresolvedIdentity.load(), 1u);
}

TEST_F(IngestionTest, AutoDiscoveryRegistersBeaconOnce) {
    Ingestor ingestor(registry, store, &records, stats, true);

    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:01", "aa:bb:cc:dd:ee:ff", -70, 5000), 6000), INGEST_STORED);
    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:01", "AABBCCDDEEFF", -71, 5100), 6000), INGEST_STORED);

    Beacon beacon;
    ASSERT_TRUE(registry.findBeaconByMac("AA:BB:CC:DD:EE:FF", beacon));
    EXPECT_EQ(beacon.id, "auto-AABBCCDDEEFF");
    EXPECT_EQ(beacon.name, "Auto-DD:EE:FF");
    EXPECT_EQ(beacon.resourceType, "Device");
    EXPECT_EQ(stats.beaconsDiscovered.load(), 1u);
    EXPECT_EQ(store.snapshot(beacon.id, 0, 10000, store.currentSequence()).size(), 2u);
}

TEST_F(IngestionTest, RejectsPositiveRssi) {
    Ingestor ingestor(registry, store, &records, stats, false);
    EXPECT_EQ(ingestor.ingest(reading("AC:23:3F:A0:00:01", "C3:00:00:1A:2B:3C", 5, 5000), 6000), INGEST_INVALID);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(IngestionTest, TimestampFallbacks) {
    Ingestor ingestor(registry, store, nullptr, stats, false);

    ingestor.ingest(reading("AC:23:3F:A0:00:01", "C3:00:00:1A:2B:3C", -70, 0), 7000);
    ingestor.ingest(reading("AC:23:3F:A0:00:01", "C3:00:00:1A:2B:3C", -70, 500000), 8000);

    std::vector<RawSignal> signals = store.snapshot("pump-1", 0, 1000000, store.currentSequence());
    ASSERT_EQ(signals.size(), 2u);
    EXPECT_EQ(signals[0].observedAtMs, 7000u);
    EXPECT_EQ(signals[1].observedAtMs, 8000u);  // far future clamped to receipt
}

TEST_F(IngestionTest, IngestsDecodedLines) {
    Ingestor ingestor(registry, store, &records, stats, false);

    EXPECT_EQ(ingestor.ingestLine("{\"device_info\":{\"mac\":\"AC233FA00001\"},\"beacons\":["
                                  "{\"mac\":\"C300001A2B3C\",\"rssi\":-65},"
                                  "{\"mac\":\"C300001A2B3C\",\"rssi\":-66},"
                                  "{\"mac\":\"112233445566\",\"rssi\":-80}]}",
                                  9000),
              2u);
    EXPECT_EQ(stats.signalsReceived.load(), 3u);
    EXPECT_EQ(stats.unresolvedIdentity.load(), 1u);

    EXPECT_EQ(ingestor.ingestLine("garbage", 9000), 0u);
    EXPECT_EQ(ingestor.ingestLine("{\"broken\":", 9000), 0u);
    EXPECT_EQ(stats.decodeErrors.load(), 2u);
}

TEST(IngestResultTest, Names) {
    EXPECT_STREQ(ingestResultName(INGEST_STORED), "stored");
    EXPECT_STREQ(ingestResultName(INGEST_UNRESOLVED_GATEWAY), "unresolved_gateway");
}
