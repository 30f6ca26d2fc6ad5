#include "config.h"
#include "log.h"
#include <ArduinoJson.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace beacontrack {

PipelineConfig defaultPipelineConfig() {
    PipelineConfig config;
    config.windowMs = 5000;
    config.tickPeriodMs = 1000;
    config.smoothingAlpha = 0.3;
    config.stabilityDistance = 0.5;
    config.driftWindowMs = 10000;
    config.cooldownMs = BEACONTRACK_ALERT_COOLDOWN_MS;
    config.minDistance = 0.1;
    config.maxDistance = 100.0;
    config.maxUsableDistance = 50.0;
    config.retentionMs = 60000;
    config.staleTrackMs = 60000;
    config.maxIterations = 100;
    config.convergenceEpsilon = 1e-6;
    config.workerThreads = 4;
    config.stopGraceMs = 2000;
    config.defaultReferencePower = BEACONTRACK_DEFAULT_REFERENCE_POWER;
    config.defaultPathLossExponent = BEACONTRACK_DEFAULT_PATH_LOSS_EXPONENT;
    config.autoDiscoverBeacons = false;
    config.inboundQueueSize = 10000;
    config.outboundQueueSize = 1000;
    config.diagnosticsIntervalMs = 60000;
    return config;
}

IoConfig defaultIoConfig() {
    IoConfig io;
    io.input = "-";
    io.output = "-";
    io.positionsTopic = "careflow/positions";
    io.alertsTopic = "careflow/alerts";
    return io;
}

PathLossConfig toPathLossConfig(const PipelineConfig &config) {
    PathLossConfig out;
    out.defaultReferencePower = config.defaultReferencePower;
    out.defaultExponent = config.defaultPathLossExponent;
    out.minDistance = config.minDistance;
    out.maxDistance = config.maxDistance;
    return out;
}

EstimatorConfig toEstimatorConfig(const PipelineConfig &config) {
    EstimatorConfig out = defaultEstimatorConfig();
    out.maxIterations = config.maxIterations;
    out.convergenceEpsilon = config.convergenceEpsilon;
    return out;
}

SmootherConfig toSmootherConfig(const PipelineConfig &config) {
    SmootherConfig out = defaultSmootherConfig();
    out.alpha = config.smoothingAlpha;
    out.stabilityDistance = config.stabilityDistance;
    out.driftWindowMs = config.driftWindowMs;
    out.staleTrackMs = config.staleTrackMs;
    return out;
}

ZoneEngineConfig toZoneEngineConfig(const PipelineConfig &config) {
    ZoneEngineConfig out;
    out.cooldownMs = config.cooldownMs;
    return out;
}

bool readTextFile(const std::string &path, std::string &out) {
    std::ifstream file(path.c_str());
    if (!file) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

static void readDouble(JsonObjectConst obj, const char *key, double minValue, double maxValue, double &target) {
    if (!obj.containsKey(key)) return;
    if (!obj[key].is<double>()) {
        logPrintf("[CONFIG] %s: not a number, using %g\n", key, target);
        return;
    }
    double value = obj[key].as<double>();
    if (!std::isfinite(value) || value < minValue || value > maxValue) {
        logPrintf("[CONFIG] %s=%g out of range [%g, %g], using %g\n", key, value, minValue, maxValue, target);
        return;
    }
    target = value;
}

static void readFloat(JsonObjectConst obj, const char *key, double minValue, double maxValue, float &target) {
    double value = target;
    readDouble(obj, key, minValue, maxValue, value);
    target = (float)value;
}

static void readCount(JsonObjectConst obj, const char *key, uint32_t minValue, uint32_t maxValue,
                      uint32_t &target) {
    double value = target;
    readDouble(obj, key, minValue, maxValue, value);
    target = (uint32_t)value;
}

// Seconds in the document, milliseconds in memory
static void readSeconds(JsonObjectConst obj, const char *key, double minValue, double maxValue,
                        uint32_t &targetMs) {
    double seconds = targetMs / 1000.0;
    readDouble(obj, key, minValue, maxValue, seconds);
    targetMs = (uint32_t)llround(seconds * 1000.0);
}

static void readString(JsonObjectConst obj, const char *key, std::string &target) {
    if (!obj.containsKey(key)) return;
    if (!obj[key].is<const char *>()) {
        logPrintf("[CONFIG] %s: not a string, using '%s'\n", key, target.c_str());
        return;
    }
    target = obj[key].as<std::string>();
}

static void loadPipeline(JsonObjectConst obj, PipelineConfig &config) {
    readSeconds(obj, "windowSeconds", 0.5, 600, config.windowMs);
    readSeconds(obj, "tickPeriodSeconds", 0.05, 60, config.tickPeriodMs);
    readDouble(obj, "smoothingAlpha", 0.01, 1.0, config.smoothingAlpha);
    readDouble(obj, "stabilityDistance", 0.0, 50.0, config.stabilityDistance);
    readSeconds(obj, "driftWindowSeconds", 0, 3600, config.driftWindowMs);
    readSeconds(obj, "cooldownSeconds", 0, 86400, config.cooldownMs);
    readDouble(obj, "minDistance", 0.01, 10.0, config.minDistance);
    readDouble(obj, "maxDistance", 1.0, 1000.0, config.maxDistance);
    readDouble(obj, "maxUsableDistance", 1.0, 1000.0, config.maxUsableDistance);
    readSeconds(obj, "retentionSeconds", 1, 86400, config.retentionMs);
    readSeconds(obj, "staleTrackSeconds", 1, 86400, config.staleTrackMs);
    readCount(obj, "maxIterations", 1, 10000, config.maxIterations);
    readDouble(obj, "convergenceEpsilon", 1e-12, 1.0, config.convergenceEpsilon);
    readCount(obj, "workerThreads", 1, 64, config.workerThreads);
    readCount(obj, "stopGraceMs", 0, 60000, config.stopGraceMs);
    readFloat(obj, "defaultReferencePower", -100.0, -20.0, config.defaultReferencePower);
    readFloat(obj, "defaultPathLossExponent", 1.5, 6.0, config.defaultPathLossExponent);
    readCount(obj, "inboundQueueSize", 1, 1000000, config.inboundQueueSize);
    readCount(obj, "outboundQueueSize", 1, 1000000, config.outboundQueueSize);
    readSeconds(obj, "diagnosticsIntervalSeconds", 0, 86400, config.diagnosticsIntervalMs);

    if (obj.containsKey("autoDiscoverBeacons")) {
        config.autoDiscoverBeacons = obj["autoDiscoverBeacons"].as<bool>();
    }

    if (config.minDistance >= config.maxDistance) {
        logPrintf("[CONFIG] minDistance %.2f >= maxDistance %.2f, using 0.1/100\n",
                  config.minDistance, config.maxDistance);
        config.minDistance = 0.1;
        config.maxDistance = 100.0;
    }
    if (config.retentionMs < config.windowMs) {
        logPrintf("[CONFIG] retentionSeconds shorter than windowSeconds, raising to %u ms\n",
                  (unsigned)config.windowMs);
        config.retentionMs = config.windowMs;
    }
}

static void loadIo(JsonObjectConst obj, IoConfig &io) {
    readString(obj, "input", io.input);
    readString(obj, "output", io.output);
    readString(obj, "positionsTopic", io.positionsTopic);
    readString(obj, "alertsTopic", io.alertsTopic);
    readString(obj, "historyFile", io.historyFile);
    readString(obj, "logFile", io.logFile);
}

static bool hasNumber(JsonObjectConst obj, const char *key) {
    return obj.containsKey(key) && obj[key].is<double>();
}

static size_t loadFloors(JsonArrayConst arr, SiteRegistry &registry) {
    size_t rejected = 0;
    for (JsonObjectConst f : arr) {
        Floor floor;
        floor.id = std::string(f["id"] | "");
        floor.name = f.containsKey("name") ? std::string(f["name"] | "") : floor.id;
        floor.building = f["building"] | "";
        floor.width = f["width"] | 0.0;
        floor.height = f["height"] | 0.0;
        if (!registry.addFloor(floor)) rejected++;
    }
    return rejected;
}

static size_t loadGateways(JsonArrayConst arr, SiteRegistry &registry) {
    size_t rejected = 0;
    for (JsonObjectConst g : arr) {
        Gateway gateway;
        gateway.id = std::string(g["id"] | "");
        gateway.mac = std::string(g["mac"] | "");
        gateway.floorId = std::string(g["floor"] | "");
        if (!hasNumber(g, "x") || !hasNumber(g, "y")) {
            logPrintf("[CONFIG] Gateway '%s' rejected: missing position\n", gateway.id.c_str());
            rejected++;
            continue;
        }
        gateway.x = g["x"].as<double>();
        gateway.y = g["y"].as<double>();

        gateway.calibration.hasReferencePower = hasNumber(g, "referencePower");
        gateway.calibration.hasExponent = hasNumber(g, "pathLossExponent") && g["pathLossExponent"].as<float>() > 0.0f;
        if (gateway.calibration.hasReferencePower) {
            gateway.calibration.referencePower = g["referencePower"].as<float>();
        }
        if (gateway.calibration.hasExponent) {
            gateway.calibration.pathLossExponent = g["pathLossExponent"].as<float>();
        }
        gateway.calibration.calibrated = gateway.calibration.hasReferencePower && gateway.calibration.hasExponent;

        if (!gateway.calibration.calibrated) {
            logPrintf("[CONFIG] Gateway '%s' %s, distances will use fallbacks\n", gateway.id.c_str(),
                      gateway.calibration.hasReferencePower || gateway.calibration.hasExponent
                          ? "is partially calibrated"
                          : "has no calibration");
        }
        if (!registry.addGateway(gateway)) rejected++;
    }
    return rejected;
}

static size_t loadBeacons(JsonArrayConst arr, SiteRegistry &registry) {
    size_t rejected = 0;
    for (JsonObjectConst b : arr) {
        Beacon beacon;
        beacon.id = std::string(b["id"] | "");
        beacon.mac = std::string(b["mac"] | "");
        beacon.name = b["name"] | "";
        beacon.resourceType = b["resourceType"] | "Device";
        if (!registry.addBeacon(beacon)) rejected++;
    }
    return rejected;
}

static bool readPolygon(JsonObjectConst z, std::vector<Point2D> &polygon) {
    if (z.containsKey("polygon")) {
        for (JsonArrayConst vertex : z["polygon"].as<JsonArrayConst>()) {
            if (vertex.size() != 2 || !vertex[0].is<double>() || !vertex[1].is<double>()) return false;
            Point2D p;
            p.x = vertex[0].as<double>();
            p.y = vertex[1].as<double>();
            polygon.push_back(p);
        }
        return true;
    }
    if (z.containsKey("rect")) {
        JsonObjectConst r = z["rect"];
        if (!hasNumber(r, "xMin") || !hasNumber(r, "yMin") || !hasNumber(r, "xMax") || !hasNumber(r, "yMax")) {
            return false;
        }
        double xMin = r["xMin"].as<double>();
        double yMin = r["yMin"].as<double>();
        double xMax = r["xMax"].as<double>();
        double yMax = r["yMax"].as<double>();
        if (xMin >= xMax || yMin >= yMax) return false;
        polygon.push_back(Point2D{xMin, yMin});
        polygon.push_back(Point2D{xMax, yMin});
        polygon.push_back(Point2D{xMax, yMax});
        polygon.push_back(Point2D{xMin, yMax});
        return true;
    }
    return false;
}

static size_t loadZones(JsonArrayConst arr, SiteRegistry &registry) {
    size_t rejected = 0;
    for (JsonObjectConst z : arr) {
        Zone zone;
        zone.id = std::string(z["id"] | "");
        zone.name = z.containsKey("name") ? std::string(z["name"] | "") : zone.id;
        zone.floorId = std::string(z["floor"] | "");

        if (!readPolygon(z, zone.polygon)) {
            logPrintf("[CONFIG] Zone '%s' rejected: bad polygon or rect\n", zone.id.c_str());
            rejected++;
            continue;
        }

        zone.alerts.onEntry = z["alertOnEntry"] | true;
        zone.alerts.onExit = z["alertOnExit"] | true;
        zone.alerts.dwellAlert = z["dwellAlert"] | false;
        double dwellSeconds = z["dwellThresholdSeconds"] | 300.0;
        if (dwellSeconds < 0) dwellSeconds = 300.0;
        zone.alerts.dwellThresholdMs = (uint32_t)llround(dwellSeconds * 1000.0);
        if (!registry.addZone(zone)) rejected++;
    }
    return rejected;
}

static size_t documentCapacity(const std::string &json) {
    size_t capacity = json.size() * 8;
    return capacity < BEACONTRACK_CONFIG_DOC_MIN ? BEACONTRACK_CONFIG_DOC_MIN : capacity;
}

bool loadConfigurationFromString(const std::string &json, PipelineConfig &pipeline, IoConfig &io,
                                 SiteRegistry &registry) {
    DynamicJsonDocument doc(documentCapacity(json));
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        logPrintf("[CONFIG] Failed to parse config: %s\n", error.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        logPrintf("[CONFIG] Config root is not an object\n");
        return false;
    }

    if (root.containsKey("pipeline")) loadPipeline(root["pipeline"], pipeline);
    if (root.containsKey("io")) loadIo(root["io"], io);

    size_t rejected = loadFloors(root["floors"], registry);
    rejected += loadGateways(root["gateways"], registry);
    rejected += loadBeacons(root["beacons"], registry);
    rejected += loadZones(root["zones"], registry);
    if (rejected > 0) {
        logPrintf("[CONFIG] WARNING: %u site entries rejected\n", (unsigned)rejected);
    }

    if (registry.gatewayCount() == 0) {
        logPrintf("[CONFIG] No valid gateways configured\n");
        return false;
    }

    logPrintf("[CONFIG] Loaded %u gateways, %u beacons, %u zones\n", (unsigned)registry.gatewayCount(),
              (unsigned)registry.beaconCount(), (unsigned)registry.getZones().size());
    return true;
}

bool loadConfiguration(const std::string &path, PipelineConfig &pipeline, IoConfig &io,
                       SiteRegistry &registry) {
    std::string json;
    if (!readTextFile(path, json)) {
        logPrintf("[CONFIG] Failed to open config file '%s'\n", path.c_str());
        return false;
    }
    return loadConfigurationFromString(json, pipeline, io, registry);
}

bool parseCalibrationSamples(const std::string &json, std::vector<PathLossSample> &out) {
    DynamicJsonDocument doc(documentCapacity(json));
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        logPrintf("[CALIB] Failed to parse samples: %s\n", error.c_str());
        return false;
    }

    JsonArrayConst samples = doc["samples"];
    if (samples.isNull()) {
        logPrintf("[CALIB] No 'samples' array\n");
        return false;
    }

    for (JsonObjectConst s : samples) {
        if (!s["gateway"].is<const char *>() || !hasNumber(s, "rssi") || !hasNumber(s, "distance")) {
            logPrintf("[CALIB] Skipping malformed sample\n");
            continue;
        }
        PathLossSample sample;
        sample.gatewayId = s["gateway"].as<std::string>();
        sample.rssi = s["rssi"].as<float>();
        sample.distance = s["distance"].as<float>();
        out.push_back(sample);
    }
    return true;
}

}  // namespace beacontrack
