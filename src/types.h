#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace beacontrack {

struct Point2D {
    double x;
    double y;
};

// calibrated means both values are known; a gateway may configure just one.
struct PathLossCalibration {
    float referencePower = 0.0f;     // dBm at 1m
    float pathLossExponent = 0.0f;
    bool calibrated = false;
    bool hasReferencePower = false;
    bool hasExponent = false;
};

struct Floor {
    std::string id;
    std::string name;
    std::string building;
    double width;
    double height;
};

struct Gateway {
    std::string id;
    std::string mac;
    std::string floorId;
    double x;
    double y;
    PathLossCalibration calibration;
};

struct Beacon {
    std::string id;
    std::string mac;
    std::string name;
    std::string resourceType;
};

struct RawSignal {
    std::string beaconId;
    std::string gatewayId;
    int8_t rssi;
    int8_t txPower;
    bool hasTxPower;
    uint64_t observedAtMs;
    uint64_t sequence;        // assigned by SignalStore on append
};

struct AggregatedSignal {
    std::string beaconId;
    std::string gatewayId;
    float robustRssi;
    uint32_t sampleCount;     // samples kept after IQR rejection
    uint32_t rejectedCount;
    float txPower;
    bool hasTxPower;
    uint64_t windowStartMs;
    uint64_t windowEndMs;
};

enum EstimationMethod { METHOD_NONE, METHOD_TWO_POINT, METHOD_LEAST_SQUARES };

enum EstimateStatus {
    ESTIMATE_OK,
    ESTIMATE_INSUFFICIENT,
    ESTIMATE_DEGENERATE,
    ESTIMATE_NOT_CONVERGED
};

struct PositionEstimate {
    std::string beaconId;
    std::string floorId;
    double x;
    double y;
    double accuracy;
    EstimationMethod method;
    EstimateStatus status;
    uint32_t gatewayCount;
    uint32_t iterations;
    uint64_t computedAtMs;
};

struct SmoothedPosition {
    std::string beaconId;
    std::string floorId;
    double x;
    double y;
    double velocityX;
    double velocityY;
    double speed;
    double heading;           // degrees [0, 360), valid only when hasHeading
    bool hasHeading;
    double accuracy;
    EstimationMethod method;
    uint64_t updatedAtMs;
};

struct ZoneAlertConfig {
    bool onEntry;
    bool onExit;
    bool dwellAlert;
    uint32_t dwellThresholdMs;
};

struct Zone {
    std::string id;
    std::string name;
    std::string floorId;
    std::vector<Point2D> polygon;
    ZoneAlertConfig alerts;
};

struct ZoneMembership {
    std::string beaconId;
    std::string zoneId;
    uint64_t sinceMs;
    bool dwellFired;
};

enum AlertType { ALERT_ENTRY, ALERT_EXIT, ALERT_DWELL };

struct ZoneAlertEvent {
    uint64_t id;
    std::string beaconId;
    std::string zoneId;
    AlertType type;
    double x;
    double y;
    uint64_t triggeredAtMs;
    bool acknowledged;
};

const char *alertTypeName(AlertType type);
const char *estimationMethodName(EstimationMethod method);
const char *estimateStatusName(EstimateStatus status);

}  // namespace beacontrack
