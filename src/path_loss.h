#pragma once
#include "types.h"
#include <map>
#include <string>
#include <vector>

namespace beacontrack {

#ifndef BEACONTRACK_DEFAULT_REFERENCE_POWER
#define BEACONTRACK_DEFAULT_REFERENCE_POWER -59.0f   // BLE beacon @ 1m, ~0dBm tx
#endif
#ifndef BEACONTRACK_CALIBRATION_BLEND_ALPHA
#define BEACONTRACK_CALIBRATION_BLEND_ALPHA 0.3f
#endif
#ifndef BEACONTRACK_DEFAULT_PATH_LOSS_EXPONENT
#define BEACONTRACK_DEFAULT_PATH_LOSS_EXPONENT 2.0f  // free space
#endif

struct PathLossConfig {
    float defaultReferencePower;
    float defaultExponent;
    double minDistance;
    double maxDistance;
};

PathLossConfig defaultPathLossConfig();

enum CalibrationSource {
    CALIBRATION_GATEWAY,
    CALIBRATION_PARTIAL,      // configured reference power, default exponent
    CALIBRATION_ADVERTISED,
    CALIBRATION_DEFAULT
};

struct PathLossSample {
    std::string gatewayId;
    float rssi;
    float distance;  // measured, meters
};

struct CalibrationResult {
    PathLossCalibration calibration;
    size_t samples;
    bool blended;             // moved from a configured calibration
};

const size_t PATH_LOSS_MIN_SAMPLES = 5;
const float PATH_LOSS_MIN_EXPONENT = 1.5f;
const float PATH_LOSS_MAX_EXPONENT = 6.0f;
const float PATH_LOSS_MIN_REFERENCE = -100.0f;
const float PATH_LOSS_MAX_REFERENCE = -20.0f;

bool isCalibrationValid(const PathLossCalibration &cal);

// Log-distance path loss: d = 10^((P0 - RSSI) / (10 * n)), clamped to
// [minDistance, maxDistance].
double rssiToDistance(const PathLossCalibration &cal, float rssi, const PathLossConfig &config);

// Each value is resolved on its own. Reference power: configured, then
// advertised tx power, then the default. Exponent: configured, then the
// default. The source names where the reference power came from.
CalibrationSource resolveCalibration(const Gateway &gateway, const AggregatedSignal &signal,
                                     const PathLossConfig &config, PathLossCalibration &out);

bool fitPathLossCalibration(const std::vector<PathLossSample> &samples, PathLossCalibration &out);
PathLossCalibration blendCalibration(const PathLossCalibration &current,
                                     const PathLossCalibration &estimate, float alpha);

// Fits every gateway that has samples. A gateway whose configured
// calibration is complete moves toward the fit by alpha instead of being
// replaced. Returns the number of gateways calibrated.
size_t calibrateGateways(const std::vector<PathLossSample> &samples, const std::vector<Gateway> &configured,
                         float alpha, std::map<std::string, CalibrationResult> &out);

}  // namespace beacontrack
