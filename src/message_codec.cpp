#include "message_codec.h"
#include "log.h"
#include "mac_address.h"
#include <ArduinoJson.h>
#include <cmath>

namespace beacontrack {

static const size_t INBOUND_DOC_MIN = 2048;

bool splitTopicLine(const std::string &line, std::string &topic, std::string &payload) {
    size_t brace = line.find('{');
    if (brace == std::string::npos) return false;

    topic = line.substr(0, brace);
    size_t end = topic.find_last_not_of(" \t");
    topic = end == std::string::npos ? "" : topic.substr(0, end + 1);
    size_t start = topic.find_first_not_of(" \t");
    if (start != std::string::npos) topic = topic.substr(start);

    payload = line.substr(brace);
    return true;
}

bool gatewayMacFromTopic(const std::string &topic, std::string &mac) {
    size_t pos = 0;
    while (pos <= topic.length()) {
        size_t slash = topic.find('/', pos);
        std::string segment = topic.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        if (segment.length() == 12 && normalizeMac(segment, mac)) return true;
        if (slash == std::string::npos) break;
        pos = slash + 1;
    }
    return false;
}

uint64_t normalizeTimestampMs(double value) {
    if (!std::isfinite(value) || value <= 0) return 0;
    if (value > 1e12) return (uint64_t)value;
    return (uint64_t)llround(value * 1000.0);
}

static bool readMac(JsonObjectConst obj, const char *const *keys, std::string &out) {
    for (size_t i = 0; keys[i]; i++) {
        if (obj[keys[i]].is<const char *>()) {
            return normalizeMac(obj[keys[i]].as<std::string>(), out);
        }
    }
    return false;
}

static bool readNumber(JsonObjectConst obj, const char *const *keys, double &out) {
    for (size_t i = 0; keys[i]; i++) {
        if (obj[keys[i]].is<double>()) {
            out = obj[keys[i]].as<double>();
            return true;
        }
    }
    return false;
}

static const char *const GATEWAY_MAC_KEYS[] = {"gatewayMac", "gateway_mac", nullptr};
static const char *const DEVICE_MAC_KEYS[] = {"mac", nullptr};
static const char *const BEACON_MAC_KEYS[] = {"mac", "beacon_mac", "bleMAC", nullptr};
static const char *const RSSI_KEYS[] = {"rssi", "RSSI", nullptr};
static const char *const TX_POWER_KEYS[] = {"txPower", "tx_power", nullptr};
static const char *const TIMESTAMP_KEYS[] = {"timestamp", "time", nullptr};

static bool decodeReading(JsonObjectConst entry, const std::string &gatewayMac, uint64_t timestampMs,
                          GatewayReading &out) {
    if (!readMac(entry, BEACON_MAC_KEYS, out.beaconMac)) return false;

    double rssi = 0;
    if (!readNumber(entry, RSSI_KEYS, rssi)) rssi = BEACONTRACK_MISSING_RSSI;
    if (!std::isfinite(rssi) || rssi < -127 || rssi > 20) return false;
    out.rssi = (int8_t)lround(rssi);

    double txPower = 0;
    out.hasTxPower = readNumber(entry, TX_POWER_KEYS, txPower) && txPower >= -127 && txPower <= 20;
    out.txPower = out.hasTxPower ? (int8_t)lround(txPower) : 0;

    out.gatewayMac = gatewayMac;
    out.timestampMs = timestampMs;
    return true;
}

static uint64_t readTimestamp(JsonObjectConst obj, uint64_t fallbackMs) {
    double value = 0;
    if (!readNumber(obj, TIMESTAMP_KEYS, value)) return fallbackMs;
    uint64_t ms = normalizeTimestampMs(value);
    return ms > 0 ? ms : fallbackMs;
}

bool decodeGatewayMessage(const std::string &line, uint64_t receivedAtMs, std::vector<GatewayReading> &out) {
    std::string topic, payload;
    if (!splitTopicLine(line, topic, payload)) return false;

    DynamicJsonDocument doc(payload.size() * 4 < INBOUND_DOC_MIN ? INBOUND_DOC_MIN : payload.size() * 4);
    DeserializationError error = deserializeJson(doc, payload);
    if (error) {
        logPrintf("[INGEST] Decode failed: %s\n", error.c_str());
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) return false;

    std::string topicMac;
    bool hasTopicMac = !topic.empty() && gatewayMacFromTopic(topic, topicMac);
    size_t before = out.size();

    if (root.containsKey("device_info")) {
        JsonObjectConst info = root["device_info"];
        std::string gatewayMac;
        if (!readMac(info, DEVICE_MAC_KEYS, gatewayMac)) {
            if (!hasTopicMac) return false;
            gatewayMac = topicMac;
        }
        uint64_t timestampMs = readTimestamp(info, readTimestamp(root, receivedAtMs));

        JsonArrayConst entries = root.containsKey("beacons") ? root["beacons"] : root["data"];
        for (JsonObjectConst entry : entries) {
            GatewayReading reading;
            if (decodeReading(entry, gatewayMac, readTimestamp(entry, timestampMs), reading)) {
                out.push_back(reading);
            }
        }
        return out.size() > before;
    }

    std::string gatewayMac;
    if (!readMac(root, GATEWAY_MAC_KEYS, gatewayMac)) {
        if (!hasTopicMac) return false;
        gatewayMac = topicMac;
    }

    GatewayReading reading;
    if (!decodeReading(root, gatewayMac, readTimestamp(root, receivedAtMs), reading)) return false;
    out.push_back(reading);
    return true;
}

double roundTo(double value, int decimals) {
    double scale = pow(10.0, decimals);
    return round(value * scale) / scale;
}

std::string positionTopic(const std::string &prefix, const Beacon &beacon) {
    std::string mac = compactMac(beacon.mac);
    return prefix + "/" + mac;
}

std::string alertTopic(const std::string &prefix, const ZoneAlertEvent &alert) {
    return prefix + "/" + alertTypeName(alert.type) + "/" + alert.zoneId;
}

static void fillBeacon(JsonObject obj, const Beacon &beacon) {
    obj["mac"] = beacon.mac;
    obj["name"] = beacon.name;
    obj["resource_type"] = beacon.resourceType;
}

std::string encodePositionMessage(const Beacon &beacon, const Floor &floor, const SmoothedPosition &position) {
    DynamicJsonDocument doc(1024);
    doc["type"] = "position";
    fillBeacon(doc.createNestedObject("beacon"), beacon);

    JsonObject location = doc.createNestedObject("location");
    location["floor_id"] = floor.id;
    location["floor_name"] = floor.name;
    location["building_name"] = floor.building;
    location["x"] = roundTo(position.x, 2);
    location["y"] = roundTo(position.y, 2);
    location["accuracy"] = roundTo(position.accuracy, 2);

    JsonObject movement = doc.createNestedObject("movement");
    movement["speed"] = roundTo(position.speed, 3);
    if (position.hasHeading) {
        movement["heading"] = roundTo(position.heading, 1);
    } else {
        movement["heading"] = (char *)0;
    }
    movement["velocity_x"] = roundTo(position.velocityX, 3);
    movement["velocity_y"] = roundTo(position.velocityY, 3);

    doc["method"] = estimationMethodName(position.method);
    doc["timestamp"] = formatIsoTimestamp(position.updatedAtMs);

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodeAlertMessage(const Beacon &beacon, const Zone &zone, const Floor &floor,
                               const ZoneAlertEvent &alert) {
    DynamicJsonDocument doc(1024);
    doc["type"] = "zone_alert";
    doc["alert_type"] = alertTypeName(alert.type);
    fillBeacon(doc.createNestedObject("beacon"), beacon);

    JsonObject z = doc.createNestedObject("zone");
    z["id"] = zone.id;
    z["name"] = zone.name;
    z["floor_name"] = floor.name;

    JsonObject position = doc.createNestedObject("position");
    position["x"] = roundTo(alert.x, 2);
    position["y"] = roundTo(alert.y, 2);

    doc["timestamp"] = formatIsoTimestamp(alert.triggeredAtMs);

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodeEstimateRecord(const PositionEstimate &estimate) {
    DynamicJsonDocument doc(512);
    doc["record"] = "estimate";
    doc["beacon_id"] = estimate.beaconId;
    doc["floor_id"] = estimate.floorId;
    doc["x"] = roundTo(estimate.x, 2);
    doc["y"] = roundTo(estimate.y, 2);
    doc["accuracy"] = roundTo(estimate.accuracy, 2);
    doc["method"] = estimationMethodName(estimate.method);
    doc["status"] = estimateStatusName(estimate.status);
    doc["gateways"] = estimate.gatewayCount;
    doc["iterations"] = estimate.iterations;
    doc["timestamp"] = estimate.computedAtMs;

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodePositionRecord(const SmoothedPosition &position) {
    DynamicJsonDocument doc(512);
    doc["record"] = "position";
    doc["beacon_id"] = position.beaconId;
    doc["floor_id"] = position.floorId;
    doc["x"] = roundTo(position.x, 2);
    doc["y"] = roundTo(position.y, 2);
    doc["accuracy"] = roundTo(position.accuracy, 2);
    doc["speed"] = roundTo(position.speed, 3);
    if (position.hasHeading) {
        doc["heading"] = roundTo(position.heading, 1);
    } else {
        doc["heading"] = (char *)0;
    }
    doc["method"] = estimationMethodName(position.method);
    doc["timestamp"] = position.updatedAtMs;

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodeAlertRecord(const ZoneAlertEvent &alert) {
    DynamicJsonDocument doc(512);
    doc["record"] = "alert";
    doc["id"] = alert.id;
    doc["beacon_id"] = alert.beaconId;
    doc["zone_id"] = alert.zoneId;
    doc["alert_type"] = alertTypeName(alert.type);
    doc["x"] = roundTo(alert.x, 2);
    doc["y"] = roundTo(alert.y, 2);
    doc["acknowledged"] = alert.acknowledged;
    doc["timestamp"] = alert.triggeredAtMs;

    std::string json;
    serializeJson(doc, json);
    return json;
}

std::string encodeCalibrationReport(const std::map<std::string, CalibrationResult> &results) {
    DynamicJsonDocument doc(256 + results.size() * 256);
    for (const auto &entry : results) {
        JsonObject g = doc.createNestedObject(entry.first);
        g["referencePower"] = roundTo(entry.second.calibration.referencePower, 1);
        g["pathLossExponent"] = roundTo(entry.second.calibration.pathLossExponent, 2);
        g["samples"] = entry.second.samples;
        g["blended"] = entry.second.blended;
    }

    std::string json;
    serializeJsonPretty(doc, json);
    return json;
}

}  // namespace beacontrack
