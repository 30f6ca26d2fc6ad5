#include "log.h"
#include "record_store.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace beacontrack;

namespace {

SmoothedPosition makePosition(const std::string &beacon, uint64_t atMs) {
    SmoothedPosition p;
    p.beaconId = beacon;
    p.floorId = "f1";
    p.x = 1.0;
    p.y = 2.0;
    p.velocityX = 0;
    p.velocityY = 0;
    p.speed = 0;
    p.heading = 0;
    p.hasHeading = false;
    p.accuracy = 0.8;
    p.method = METHOD_LEAST_SQUARES;
    p.updatedAtMs = atMs;
    return p;
}

PositionEstimate makeEstimate(const std::string &beacon, uint64_t atMs, EstimateStatus status) {
    PositionEstimate e;
    e.beaconId = beacon;
    e.floorId = "f1";
    e.x = 1.234;
    e.y = 2.0;
    e.accuracy = 4.5;
    e.method = METHOD_LEAST_SQUARES;
    e.status = status;
    e.gatewayCount = 3;
    e.iterations = 100;
    e.computedAtMs = atMs;
    return e;
}

ZoneAlertEvent makeAlert(uint64_t id) {
    ZoneAlertEvent a;
    a.id = id;
    a.beaconId = "b1";
    a.zoneId = "z1";
    a.type = ALERT_ENTRY;
    a.x = 1;
    a.y = 1;
    a.triggeredAtMs = id * 1000;
    a.acknowledged = false;
    return a;
}

std::vector<std::string> readLines(const std::string &path) {
    std::vector<std::string> lines;
    std::ifstream in(path.c_str());
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}  // namespace

TEST(MemoryRecordStoreTest, QueriesByBeaconAndTime) {
    MemoryRecordStore records;
    records.appendPosition(makePosition("b1", 1000));
    records.appendPosition(makePosition("b1", 2000));
    records.appendPosition(makePosition("b2", 1500));
    records.appendPosition(makePosition("b1", 3000));

    std::vector<SmoothedPosition> found = records.queryPositions("b1", 1500, 3000);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].updatedAtMs, 2000u);
    EXPECT_EQ(found[1].updatedAtMs, 3000u);
}

TEST(MemoryRecordStoreTest, EvictsOldestWhenFull) {
    MemoryRecordStore records(3);
    for (uint64_t t = 1; t <= 5; t++) records.appendPosition(makePosition("b1", t * 1000));

    std::vector<SmoothedPosition> found = records.queryPositions("b1", 0, 10000);
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found.front().updatedAtMs, 3000u);
}

TEST(MemoryRecordStoreTest, AcknowledgeAlert) {
    MemoryRecordStore records;
    records.appendAlert(makeAlert(1));
    records.appendAlert(makeAlert(2));
    EXPECT_EQ(records.unacknowledgedAlerts().size(), 2u);

    EXPECT_TRUE(records.acknowledgeAlert(1));
    std::vector<ZoneAlertEvent> open = records.unacknowledgedAlerts();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].id, 2u);

    EXPECT_FALSE(records.acknowledgeAlert(99));
}

TEST(MemoryRecordStoreTest, RawSignalHistory) {
    MemoryRecordStore records;
    RawSignal s;
    s.beaconId = "b1";
    s.gatewayId = "gw-a";
    s.rssi = -70;
    s.txPower = 0;
    s.hasTxPower = false;
    s.observedAtMs = 4000;
    s.sequence = 9;
    records.appendRawSignal(s);

    EXPECT_EQ(records.queryRawSignals("b1", 0, 5000).size(), 1u);
    EXPECT_TRUE(records.queryRawSignals("b1", 4001, 5000).empty());
}

TEST(MemoryRecordStoreTest, KeepsRawEstimatesWithStatus) {
    MemoryRecordStore records(10);
    records.appendEstimate(makeEstimate("b1", 1000, ESTIMATE_OK));
    records.appendEstimate(makeEstimate("b1", 2000, ESTIMATE_NOT_CONVERGED));
    records.appendEstimate(makeEstimate("b2", 2000, ESTIMATE_DEGENERATE));

    std::vector<PositionEstimate> b1 = records.queryEstimates("b1", 0, 5000);
    ASSERT_EQ(b1.size(), 2u);
    EXPECT_EQ(b1[1].status, ESTIMATE_NOT_CONVERGED);
    EXPECT_DOUBLE_EQ(b1[1].accuracy, 4.5);
    EXPECT_EQ(records.queryEstimates("b2", 0, 5000).size(), 1u);
    EXPECT_TRUE(records.queryEstimates("b1", 2001, 5000).empty());
}

TEST(JsonlRecordStoreTest, AppendsJsonLines) {
    setLogEnabled(false);
    char path[] = "/tmp/beacontrack_history_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);

    {
        JsonlRecordStore records(path);
        ASSERT_TRUE(records.open());
        EXPECT_TRUE(records.appendEstimate(makeEstimate("b1", 1000, ESTIMATE_DEGENERATE)));
        EXPECT_TRUE(records.appendPosition(makePosition("b1", 1000)));
        EXPECT_TRUE(records.appendAlert(makeAlert(7)));
        EXPECT_TRUE(records.acknowledgeAlert(7));
        EXPECT_TRUE(records.unacknowledgedAlerts().empty());
    }

    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[0].find("\"record\":\"estimate\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"status\":\"degenerate_geometry\""), std::string::npos);
    EXPECT_NE(lines[0].find("\"method\":\"least_squares\""), std::string::npos);
    EXPECT_NE(lines[1].find("\"record\":\"position\""), std::string::npos);
    EXPECT_NE(lines[2].find("\"acknowledged\":false"), std::string::npos);
    EXPECT_NE(lines[3].find("\"acknowledged\":true"), std::string::npos);

    remove(path);
    setLogEnabled(true);
}

TEST(JsonlRecordStoreTest, WritesFailWhenClosed) {
    setLogEnabled(false);
    JsonlRecordStore records("/nonexistent-dir/history.jsonl");
    EXPECT_FALSE(records.open());
    EXPECT_FALSE(records.appendPosition(makePosition("b1", 1000)));
    setLogEnabled(true);
}
