#pragma once
#include "path_loss.h"
#include "types.h"
#include <map>
#include <string>
#include <vector>

namespace beacontrack {

#ifndef BEACONTRACK_MISSING_RSSI
#define BEACONTRACK_MISSING_RSSI -100
#endif

// One beacon sighting reported by one gateway, MACs normalised.
struct GatewayReading {
    std::string gatewayMac;
    std::string beaconMac;
    int8_t rssi;
    int8_t txPower;
    bool hasTxPower;
    uint64_t timestampMs;
};

enum MessageKind { MESSAGE_POSITION, MESSAGE_ALERT };

struct OutboundMessage {
    MessageKind kind;
    std::string topic;
    std::string payload;
};

// Splits "<topic> <json>"; a line that starts with '{' has no topic.
bool splitTopicLine(const std::string &line, std::string &topic, std::string &payload);

// First 12-hex-digit segment of a '/'-separated topic, normalised.
bool gatewayMacFromTopic(const std::string &topic, std::string &mac);

// Seconds, or milliseconds when the value is above 1e12.
uint64_t normalizeTimestampMs(double value);

// Accepts the batch (device_info + beacons/data) and single-reading formats.
// Entries with bad MACs or RSSI are skipped; false when nothing decodes.
bool decodeGatewayMessage(const std::string &line, uint64_t receivedAtMs, std::vector<GatewayReading> &out);

double roundTo(double value, int decimals);

std::string positionTopic(const std::string &prefix, const Beacon &beacon);
std::string alertTopic(const std::string &prefix, const ZoneAlertEvent &alert);

std::string encodePositionMessage(const Beacon &beacon, const Floor &floor, const SmoothedPosition &position);
std::string encodeAlertMessage(const Beacon &beacon, const Zone &zone, const Floor &floor,
                               const ZoneAlertEvent &alert);

// Compact history records
std::string encodeEstimateRecord(const PositionEstimate &estimate);
std::string encodePositionRecord(const SmoothedPosition &position);
std::string encodeAlertRecord(const ZoneAlertEvent &alert);

std::string encodeCalibrationReport(const std::map<std::string, CalibrationResult> &results);

}  // namespace beacontrack
