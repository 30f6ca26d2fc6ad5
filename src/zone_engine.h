#pragma once
#include "keyed_arena.h"
#include "types.h"
#include <atomic>
#include <map>
#include <string>
#include <vector>

namespace beacontrack {

#ifndef BEACONTRACK_ALERT_COOLDOWN_MS
#define BEACONTRACK_ALERT_COOLDOWN_MS 30000
#endif

struct ZoneEngineConfig {
    uint32_t cooldownMs;
};

ZoneEngineConfig defaultZoneEngineConfig();

bool pointOnSegment(const Point2D &a, const Point2D &b, double x, double y);
// Ray casting; points on an edge count as inside.
bool pointInPolygon(const std::vector<Point2D> &polygon, double x, double y);

struct BeaconZoneState {
    std::map<std::string, ZoneMembership> inside;     // by zone id
    std::map<std::string, uint64_t> lastEmittedMs;    // by "zone/type"
};

class ZoneEngine {
private:
    ZoneEngineConfig config;
    std::vector<Zone> zones;                          // sorted by id
    KeyedArena<BeaconZoneState> states;
    std::atomic<uint64_t> nextAlertId;
    std::atomic<uint32_t> suppressedCount;

    bool emitIfCooledDown(BeaconZoneState &state, const std::string &beaconId, const Zone &zone,
                          AlertType type, const SmoothedPosition &position, uint64_t nowMs,
                          std::vector<ZoneAlertEvent> &events);

public:
    ZoneEngine(const std::vector<Zone> &zones, const ZoneEngineConfig &config);

    std::vector<ZoneAlertEvent> evaluate(const std::string &beaconId, const SmoothedPosition &position,
                                         uint64_t nowMs);

    std::vector<ZoneMembership> memberships(const std::string &beaconId) const;
    const Zone *findZone(const std::string &zoneId) const;
    size_t zoneCount() const { return zones.size(); }
    uint32_t getSuppressedCount() const { return suppressedCount.load(); }
};

}  // namespace beacontrack
