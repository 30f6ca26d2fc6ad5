#include "signal_aggregator.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>

using namespace beacontrack;

namespace {

RawSignal makeSignal(const std::string &gateway, int rssi, uint64_t atMs) {
    RawSignal s;
    s.beaconId = "b1";
    s.gatewayId = gateway;
    s.rssi = (int8_t)rssi;
    s.txPower = 0;
    s.hasTxPower = false;
    s.observedAtMs = atMs;
    s.sequence = 0;
    return s;
}

}  // namespace

TEST(SignalAggregatorTest, PercentileInterpolates) {
    std::vector<float> sorted = {1.0f, 2.0f, 3.0f, 4.0f};
    EXPECT_FLOAT_EQ(percentile(sorted, 0.0), 1.0f);
    EXPECT_FLOAT_EQ(percentile(sorted, 1.0), 4.0f);
    EXPECT_FLOAT_EQ(medianOf(sorted), 2.5f);
    EXPECT_FLOAT_EQ(percentile(sorted, 0.25), 1.75f);
}

TEST(SignalAggregatorTest, RejectsOutlierOutsideFences) {
    std::vector<float> values = {-60, -61, -59, -60, -62, -20};
    float robust = 0;
    uint32_t kept = 0, rejected = 0;

    ASSERT_TRUE(computeRobustRssi(values, robust, kept, rejected));
    EXPECT_FLOAT_EQ(robust, -60.0f);
    EXPECT_EQ(kept, 5u);
    EXPECT_EQ(rejected, 1u);
}

TEST(SignalAggregatorTest, IdenticalSamplesKeepAll) {
    std::vector<float> values = {-70, -70, -70};
    float robust = 0;
    uint32_t kept = 0, rejected = 0;

    ASSERT_TRUE(computeRobustRssi(values, robust, kept, rejected));
    EXPECT_FLOAT_EQ(robust, -70.0f);
    EXPECT_EQ(kept, 3u);
    EXPECT_EQ(rejected, 0u);
}

TEST(SignalAggregatorTest, OrderIndependent) {
    std::vector<RawSignal> signals;
    const int rssi[] = {-71, -68, -90, -70, -69, -72, -45, -70, -73, -66, -70};
    for (size_t i = 0; i < sizeof(rssi) / sizeof(rssi[0]); i++) {
        signals.push_back(makeSignal("gw-a", rssi[i], 1000 + i * 100));
    }

    auto reference = aggregateSignals(signals, "b1", 5000, 5000);
    ASSERT_EQ(reference.count("gw-a"), 1u);

    std::mt19937 rng(42);
    for (int round = 0; round < 20; round++) {
        std::shuffle(signals.begin(), signals.end(), rng);
        auto result = aggregateSignals(signals, "b1", 5000, 5000);
        ASSERT_EQ(result.count("gw-a"), 1u);
        EXPECT_EQ(result["gw-a"].robustRssi, reference["gw-a"].robustRssi);
        EXPECT_EQ(result["gw-a"].sampleCount, reference["gw-a"].sampleCount);
    }
}

TEST(SignalAggregatorTest, GatewayWithOneSampleExcluded) {
    std::vector<RawSignal> signals;
    signals.push_back(makeSignal("gw-a", -60, 1000));
    signals.push_back(makeSignal("gw-a", -62, 1500));
    signals.push_back(makeSignal("gw-b", -70, 1200));

    auto result = aggregateSignals(signals, "b1", 2000, 5000);
    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(result.count("gw-a"), 1u);
    EXPECT_EQ(result.count("gw-b"), 0u);
}

TEST(SignalAggregatorTest, WindowIsInclusiveAndBounded) {
    std::vector<RawSignal> signals;
    signals.push_back(makeSignal("gw-a", -50, 4999));   // before window
    signals.push_back(makeSignal("gw-a", -60, 5000));   // window start
    signals.push_back(makeSignal("gw-a", -62, 10000));  // now
    signals.push_back(makeSignal("gw-a", -40, 10001));  // future

    auto result = aggregateSignals(signals, "b1", 10000, 5000);
    ASSERT_EQ(result.count("gw-a"), 1u);
    EXPECT_EQ(result["gw-a"].sampleCount + result["gw-a"].rejectedCount, 2u);
    EXPECT_FLOAT_EQ(result["gw-a"].robustRssi, -61.0f);
    EXPECT_EQ(result["gw-a"].windowStartMs, 5000u);
    EXPECT_EQ(result["gw-a"].windowEndMs, 10000u);
}

TEST(SignalAggregatorTest, AdvertisedTxPowerIsMedian) {
    std::vector<RawSignal> signals;
    const int tx[] = {-59, -61, -60};
    for (int i = 0; i < 3; i++) {
        RawSignal s = makeSignal("gw-a", -70, 1000 + i);
        s.hasTxPower = true;
        s.txPower = (int8_t)tx[i];
        signals.push_back(s);
    }

    auto result = aggregateSignals(signals, "b1", 2000, 5000);
    ASSERT_EQ(result.count("gw-a"), 1u);
    EXPECT_TRUE(result["gw-a"].hasTxPower);
    EXPECT_FLOAT_EQ(result["gw-a"].txPower, -60.0f);
}

TEST(SignalAggregatorTest, ReadsSnapshotFromStore) {
    SignalStore store;
    store.append(makeSignal("gw-a", -60, 1000));
    store.append(makeSignal("gw-a", -64, 1100));
    uint64_t cut = store.currentSequence();
    store.append(makeSignal("gw-a", -20, 1200));

    auto result = aggregate(store, "b1", 2000, 5000, cut);
    ASSERT_EQ(result.count("gw-a"), 1u);
    EXPECT_FLOAT_EQ(result["gw-a"].robustRssi, -62.0f);
}
