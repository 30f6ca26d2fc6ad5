#pragma once
#include "path_loss.h"
#include "position_estimator.h"
#include "site_registry.h"
#include "temporal_smoother.h"
#include "zone_engine.h"
#include <string>
#include <vector>

namespace beacontrack {

#ifndef BEACONTRACK_CONFIG_DOC_MIN
#define BEACONTRACK_CONFIG_DOC_MIN 16384
#endif

struct PipelineConfig {
    uint32_t windowMs;
    uint32_t tickPeriodMs;
    double smoothingAlpha;
    double stabilityDistance;
    uint32_t driftWindowMs;
    uint32_t cooldownMs;
    double minDistance;
    double maxDistance;
    double maxUsableDistance;
    uint32_t retentionMs;
    uint32_t staleTrackMs;
    uint32_t maxIterations;
    double convergenceEpsilon;
    uint32_t workerThreads;
    uint32_t stopGraceMs;
    float defaultReferencePower;
    float defaultPathLossExponent;
    bool autoDiscoverBeacons;
    uint32_t inboundQueueSize;
    uint32_t outboundQueueSize;
    uint32_t diagnosticsIntervalMs;
};

struct IoConfig {
    std::string input;            // "-" or empty: stdin
    std::string output;           // "-" or empty: stdout
    std::string positionsTopic;
    std::string alertsTopic;
    std::string historyFile;      // empty: in-memory history only
    std::string logFile;
};

PipelineConfig defaultPipelineConfig();
IoConfig defaultIoConfig();

PathLossConfig toPathLossConfig(const PipelineConfig &config);
EstimatorConfig toEstimatorConfig(const PipelineConfig &config);
SmootherConfig toSmootherConfig(const PipelineConfig &config);
ZoneEngineConfig toZoneEngineConfig(const PipelineConfig &config);

// Out-of-range or mistyped keys fall back to their defaults with a warning.
// Invalid floors, gateways, beacons and zones are skipped. Fails only on
// unparsable JSON or when no gateway survives validation.
bool loadConfigurationFromString(const std::string &json, PipelineConfig &pipeline, IoConfig &io,
                                 SiteRegistry &registry);
bool loadConfiguration(const std::string &path, PipelineConfig &pipeline, IoConfig &io,
                       SiteRegistry &registry);

// {"samples":[{"gateway":"gw-1","rssi":-65,"distance":2.5}, ...]}
bool parseCalibrationSamples(const std::string &json, std::vector<PathLossSample> &out);

bool readTextFile(const std::string &path, std::string &out);

}  // namespace beacontrack
