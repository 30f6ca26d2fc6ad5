#include "config.h"
#include "log.h"
#include <gtest/gtest.h>

using namespace beacontrack;

namespace {

const char *SITE_JSON = R"({
  "pipeline": {
    "windowSeconds": 8,
    "tickPeriodSeconds": 0.5,
    "smoothingAlpha": 0.4,
    "cooldownSeconds": 45,
    "workerThreads": 2,
    "autoDiscoverBeacons": true
  },
  "io": {
    "input": "/tmp/gateways.fifo",
    "positionsTopic": "site/positions",
    "historyFile": "/tmp/history.jsonl"
  },
  "floors": [
    {"id": "f1", "name": "Ground", "building": "Main", "width": 50, "height": 30}
  ],
  "gateways": [
    {"id": "gw-a", "mac": "AC233FA00001", "floor": "f1", "x": 0, "y": 0,
     "referencePower": -61, "pathLossExponent": 2.4},
    {"id": "gw-b", "mac": "ac:23:3f:a0:00:02", "floor": "f1", "x": 50, "y": 0},
    {"id": "gw-c", "mac": "AC233FA00003", "floor": "f1", "x": 25, "y": 30, "referencePower": -70}
  ],
  "beacons": [
    {"id": "pump-1", "mac": "C300001A2B3C", "name": "Pump 1", "resourceType": "Equipment"},
    {"id": "badge-9", "mac": "C300001A2B3D"}
  ],
  "zones": [
    {"id": "icu", "name": "ICU", "floor": "f1", "polygon": [[0,0],[10,0],[10,10],[0,10]],
     "dwellAlert": true, "dwellThresholdSeconds": 120},
    {"id": "lobby", "floor": "f1", "rect": {"xMin": 20, "yMin": 0, "xMax": 30, "yMax": 5},
     "alertOnExit": false}
  ]
})";

class ConfigTest : public ::testing::Test {
protected:
    PipelineConfig pipeline;
    IoConfig io;
    SiteRegistry registry;

    void SetUp() override {
        setLogEnabled(false);
        pipeline = defaultPipelineConfig();
        io = defaultIoConfig();
    }
    void TearDown() override { setLogEnabled(true); }
};

}  // namespace

TEST_F(ConfigTest, LoadsFullSite) {
    ASSERT_TRUE(loadConfigurationFromString(SITE_JSON, pipeline, io, registry));

    EXPECT_EQ(pipeline.windowMs, 8000u);
    EXPECT_EQ(pipeline.tickPeriodMs, 500u);
    EXPECT_DOUBLE_EQ(pipeline.smoothingAlpha, 0.4);
    EXPECT_EQ(pipeline.cooldownMs, 45000u);
    EXPECT_EQ(pipeline.workerThreads, 2u);
    EXPECT_TRUE(pipeline.autoDiscoverBeacons);

    EXPECT_EQ(io.input, "/tmp/gateways.fifo");
    EXPECT_EQ(io.output, "-");
    EXPECT_EQ(io.positionsTopic, "site/positions");
    EXPECT_EQ(io.alertsTopic, "careflow/alerts");
    EXPECT_EQ(io.historyFile, "/tmp/history.jsonl");

    EXPECT_EQ(registry.gatewayCount(), 3u);
    EXPECT_EQ(registry.beaconCount(), 2u);

    Gateway gw;
    ASSERT_TRUE(registry.findGateway("gw-a", gw));
    EXPECT_TRUE(gw.calibration.calibrated);
    EXPECT_FLOAT_EQ(gw.calibration.referencePower, -61.0f);
    EXPECT_FLOAT_EQ(gw.calibration.pathLossExponent, 2.4f);
    ASSERT_TRUE(registry.findGatewayByMac("AC:23:3F:A0:00:02", gw));
    EXPECT_EQ(gw.id, "gw-b");
    EXPECT_FALSE(gw.calibration.calibrated);
    EXPECT_FALSE(gw.calibration.hasReferencePower);
    EXPECT_FALSE(gw.calibration.hasExponent);
    ASSERT_TRUE(registry.findGateway("gw-c", gw));
    EXPECT_FALSE(gw.calibration.calibrated);
    EXPECT_TRUE(gw.calibration.hasReferencePower);
    EXPECT_FALSE(gw.calibration.hasExponent);
    EXPECT_FLOAT_EQ(gw.calibration.referencePower, -70.0f);

    Beacon beacon;
    ASSERT_TRUE(registry.findBeacon("badge-9", beacon));
    EXPECT_EQ(beacon.name, "badge-9");
    EXPECT_EQ(beacon.resourceType, "Device");
    EXPECT_EQ(beacon.mac, "C3:00:00:1A:2B:3D");

    Zone zone;
    ASSERT_TRUE(registry.findZone("icu", zone));
    EXPECT_TRUE(zone.alerts.onEntry);
    EXPECT_TRUE(zone.alerts.dwellAlert);
    EXPECT_EQ(zone.alerts.dwellThresholdMs, 120000u);
    ASSERT_TRUE(registry.findZone("lobby", zone));
    EXPECT_EQ(zone.name, "lobby");
    EXPECT_FALSE(zone.alerts.onExit);
    ASSERT_EQ(zone.polygon.size(), 4u);
    EXPECT_DOUBLE_EQ(zone.polygon[2].x, 30.0);
    EXPECT_DOUBLE_EQ(zone.polygon[2].y, 5.0);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const char *json = R"({
      "floors": [{"id": "f1", "width": 10, "height": 10}],
      "gateways": [{"id": "g", "mac": "AC233FA00001", "floor": "f1", "x": 1, "y": 1}]
    })";
    ASSERT_TRUE(loadConfigurationFromString(json, pipeline, io, registry));

    PipelineConfig defaults = defaultPipelineConfig();
    EXPECT_EQ(pipeline.windowMs, defaults.windowMs);
    EXPECT_EQ(pipeline.tickPeriodMs, defaults.tickPeriodMs);
    EXPECT_EQ(pipeline.cooldownMs, 30000u);
    EXPECT_FALSE(pipeline.autoDiscoverBeacons);
    EXPECT_EQ(io.positionsTopic, "careflow/positions");
}

TEST_F(ConfigTest, OutOfRangeValuesFallBack) {
    const char *json = R"({
      "pipeline": {"windowSeconds": -3, "smoothingAlpha": 7, "workerThreads": "many",
                   "minDistance": 5, "maxDistance": 2, "retentionSeconds": 1},
      "floors": [{"id": "f1", "width": 10, "height": 10}],
      "gateways": [{"id": "g", "mac": "AC233FA00001", "floor": "f1", "x": 1, "y": 1}]
    })";
    ASSERT_TRUE(loadConfigurationFromString(json, pipeline, io, registry));

    EXPECT_EQ(pipeline.windowMs, 5000u);
    EXPECT_DOUBLE_EQ(pipeline.smoothingAlpha, 0.3);
    EXPECT_EQ(pipeline.workerThreads, 4u);
    EXPECT_DOUBLE_EQ(pipeline.minDistance, 0.1);
    EXPECT_DOUBLE_EQ(pipeline.maxDistance, 100.0);
    EXPECT_EQ(pipeline.retentionMs, pipeline.windowMs);
}

TEST_F(ConfigTest, InvalidSiteEntriesAreSkipped) {
    const char *json = R"({
      "floors": [{"id": "f1", "width": 10, "height": 10}, {"id": "bad", "width": 0, "height": 5}],
      "gateways": [
        {"id": "ok", "mac": "AC233FA00001", "floor": "f1", "x": 5, "y": 5},
        {"id": "outside", "mac": "AC233FA00002", "floor": "f1", "x": 11, "y": 5},
        {"id": "nofloor", "mac": "AC233FA00003", "floor": "f9", "x": 1, "y": 1},
        {"id": "badmac", "mac": "xyz", "floor": "f1", "x": 1, "y": 1},
        {"id": "ok", "mac": "AC233FA00004", "floor": "f1", "x": 1, "y": 1},
        {"id": "nopos", "mac": "AC233FA00005", "floor": "f1"}
      ],
      "zones": [
        {"id": "line", "floor": "f1", "polygon": [[0,0],[5,5]]},
        {"id": "badrect", "floor": "f1", "rect": {"xMin": 5, "yMin": 0, "xMax": 1, "yMax": 5}},
        {"id": "elsewhere", "floor": "f9", "polygon": [[0,0],[5,0],[5,5]]},
        {"id": "tri", "floor": "f1", "polygon": [[0,0],[5,0],[5,5]]}
      ]
    })";
    ASSERT_TRUE(loadConfigurationFromString(json, pipeline, io, registry));

    EXPECT_EQ(registry.gatewayCount(), 1u);
    Floor floor;
    EXPECT_FALSE(registry.findFloor("bad", floor));
    std::vector<Zone> zones = registry.getZones();
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].id, "tri");
}

TEST_F(ConfigTest, FailsWithoutGateways) {
    const char *json = R"({"floors": [{"id": "f1", "width": 10, "height": 10}], "gateways": []})";
    EXPECT_FALSE(loadConfigurationFromString(json, pipeline, io, registry));
}

TEST_F(ConfigTest, FailsOnMalformedJson) {
    EXPECT_FALSE(loadConfigurationFromString("{\"floors\": [", pipeline, io, registry));
    EXPECT_FALSE(loadConfigurationFromString("[]", pipeline, io, registry));
    EXPECT_FALSE(loadConfiguration("/nonexistent/beacontrack.json", pipeline, io, registry));
}

TEST_F(ConfigTest, ConvertsToComponentConfigs) {
    pipeline.smoothingAlpha = 0.25;
    pipeline.cooldownMs = 12000;
    pipeline.maxIterations = 42;
    pipeline.defaultReferencePower = -65.0f;

    EXPECT_DOUBLE_EQ(toSmootherConfig(pipeline).alpha, 0.25);
    EXPECT_EQ(toZoneEngineConfig(pipeline).cooldownMs, 12000u);
    EXPECT_EQ(toEstimatorConfig(pipeline).maxIterations, 42u);
    EXPECT_FLOAT_EQ(toPathLossConfig(pipeline).defaultReferencePower, -65.0f);
}

TEST_F(ConfigTest, ParsesCalibrationSamples) {
    std::vector<PathLossSample> samples;
    ASSERT_TRUE(parseCalibrationSamples(
        R"({"samples":[{"gateway":"gw-a","rssi":-60,"distance":1},{"gateway":"gw-a","rssi":"x","distance":2},
                       {"gateway":"gw-b","rssi":-72.5,"distance":4.5}]})",
        samples));

    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[1].gatewayId, "gw-b");
    EXPECT_FLOAT_EQ(samples[1].rssi, -72.5f);
    EXPECT_FLOAT_EQ(samples[1].distance, 4.5f);

    EXPECT_FALSE(parseCalibrationSamples("{}", samples));
}
