#include "path_loss.h"
#include "log.h"
#include <cmath>

namespace beacontrack {

PathLossConfig defaultPathLossConfig() {
    PathLossConfig config;
    config.defaultReferencePower = BEACONTRACK_DEFAULT_REFERENCE_POWER;
    config.defaultExponent = BEACONTRACK_DEFAULT_PATH_LOSS_EXPONENT;
    config.minDistance = 0.1;    // beacon essentially at the gateway
    config.maxDistance = 100.0;
    return config;
}

bool isCalibrationValid(const PathLossCalibration &cal) {
    return cal.calibrated && cal.pathLossExponent > 0.0f && std::isfinite(cal.referencePower);
}

double rssiToDistance(const PathLossCalibration &cal, float rssi, const PathLossConfig &config) {
    if (rssi >= cal.referencePower) return config.minDistance;

    double distance = pow(10.0, (cal.referencePower - rssi) / (10.0 * cal.pathLossExponent));

    if (distance < config.minDistance) distance = config.minDistance;
    if (distance > config.maxDistance) distance = config.maxDistance;
    return distance;
}

CalibrationSource resolveCalibration(const Gateway &gateway, const AggregatedSignal &signal,
                                     const PathLossConfig &config, PathLossCalibration &out) {
    const PathLossCalibration &configured = gateway.calibration;
    if (isCalibrationValid(configured)) {
        out = configured;
        return CALIBRATION_GATEWAY;
    }

    bool configuredExponent = configured.hasExponent && configured.pathLossExponent > 0.0f;
    out.pathLossExponent = configuredExponent ? configured.pathLossExponent : config.defaultExponent;
    out.hasExponent = true;
    out.hasReferencePower = true;
    out.calibrated = false;

    if (configured.hasReferencePower && std::isfinite(configured.referencePower)) {
        out.referencePower = configured.referencePower;
        return CALIBRATION_PARTIAL;
    }
    if (signal.hasTxPower) {
        out.referencePower = signal.txPower;
        return CALIBRATION_ADVERTISED;
    }

    out.referencePower = config.defaultReferencePower;
    return CALIBRATION_DEFAULT;
}

// Linear regression on (log10(distance), RSSI)
// Model: RSSI = A - 10*n*log10(d), A = reference power, slope = -10*n
bool fitPathLossCalibration(const std::vector<PathLossSample> &samples, PathLossCalibration &out) {
    double sumX = 0, sumY = 0, sumXX = 0, sumXY = 0;
    size_t used = 0;

    for (const auto &sample : samples) {
        if (sample.distance < 0.1f) continue;  // log(0) guard
        double x = log10(sample.distance);
        double y = sample.rssi;
        sumX += x;
        sumY += y;
        sumXX += x * x;
        sumXY += x * y;
        used++;
    }

    if (used < PATH_LOSS_MIN_SAMPLES) {
        logPrintf("[PATH_LOSS] Insufficient samples: %zu/%zu\n", used, PATH_LOSS_MIN_SAMPLES);
        return false;
    }

    double denominator = used * sumXX - sumX * sumX;
    if (fabs(denominator) < 0.0001) {
        logPrintf("[PATH_LOSS] Singular system (all samples at one distance)\n");
        return false;
    }

    double slope = (used * sumXY - sumX * sumY) / denominator;
    double intercept = (sumY - slope * sumX) / used;

    float exponent = (float)(-slope / 10.0);
    float reference = (float)intercept;

    if (exponent < PATH_LOSS_MIN_EXPONENT || exponent > PATH_LOSS_MAX_EXPONENT) {
        logPrintf("[PATH_LOSS] Invalid n=%.2f, clamping\n", exponent);
        exponent = exponent < PATH_LOSS_MIN_EXPONENT ? PATH_LOSS_MIN_EXPONENT : PATH_LOSS_MAX_EXPONENT;
    }
    if (reference < PATH_LOSS_MIN_REFERENCE || reference > PATH_LOSS_MAX_REFERENCE) {
        logPrintf("[PATH_LOSS] Invalid reference power=%.1f, clamping\n", reference);
        reference = reference < PATH_LOSS_MIN_REFERENCE ? PATH_LOSS_MIN_REFERENCE : PATH_LOSS_MAX_REFERENCE;
    }

    out.referencePower = reference;
    out.pathLossExponent = exponent;
    out.hasReferencePower = true;
    out.hasExponent = true;
    out.calibrated = true;

    logPrintf("[PATH_LOSS] Fitted: P0=%.1f n=%.2f (samples=%zu)\n", reference, exponent, used);
    return true;
}

PathLossCalibration blendCalibration(const PathLossCalibration &current,
                                     const PathLossCalibration &estimate, float alpha) {
    if (!isCalibrationValid(current)) return estimate;

    PathLossCalibration blended;
    blended.referencePower = alpha * estimate.referencePower + (1 - alpha) * current.referencePower;
    blended.pathLossExponent = alpha * estimate.pathLossExponent + (1 - alpha) * current.pathLossExponent;
    blended.hasReferencePower = true;
    blended.hasExponent = true;
    blended.calibrated = true;
    return blended;
}

size_t calibrateGateways(const std::vector<PathLossSample> &samples, const std::vector<Gateway> &configured,
                         float alpha, std::map<std::string, CalibrationResult> &out) {
    std::map<std::string, std::vector<PathLossSample>> byGateway;
    for (const auto &sample : samples) byGateway[sample.gatewayId].push_back(sample);

    std::map<std::string, const Gateway *> known;
    for (const auto &gateway : configured) known[gateway.id] = &gateway;

    for (const auto &entry : byGateway) {
        CalibrationResult result;
        if (!fitPathLossCalibration(entry.second, result.calibration)) {
            logPrintf("[CALIB] Gateway %s: fit failed (%u samples)\n", entry.first.c_str(),
                      (unsigned)entry.second.size());
            continue;
        }
        result.samples = entry.second.size();
        result.blended = false;

        auto gateway = known.find(entry.first);
        if (gateway != known.end() && isCalibrationValid(gateway->second->calibration)) {
            result.calibration = blendCalibration(gateway->second->calibration, result.calibration, alpha);
            result.blended = true;
            logPrintf("[CALIB] Gateway %s: blended into configured P0=%.1f n=%.2f\n", entry.first.c_str(),
                      gateway->second->calibration.referencePower, gateway->second->calibration.pathLossExponent);
        } else if (!configured.empty() && gateway == known.end()) {
            logPrintf("[CALIB] Gateway %s is not in the site configuration\n", entry.first.c_str());
        }
        out[entry.first] = result;
    }

    for (const auto &gateway : configured) {
        if (!byGateway.count(gateway.id)) {
            logPrintf("[CALIB] Gateway %s: no samples\n", gateway.id.c_str());
        }
    }
    return out.size();
}

}  // namespace beacontrack
