#include "zone_engine.h"
#include "log.h"
#include <algorithm>
#include <cmath>

namespace beacontrack {

static const double EDGE_EPSILON = 1e-9;

ZoneEngineConfig defaultZoneEngineConfig() {
    ZoneEngineConfig config;
    config.cooldownMs = BEACONTRACK_ALERT_COOLDOWN_MS;
    return config;
}

bool pointOnSegment(const Point2D &a, const Point2D &b, double x, double y) {
    double cross = (b.x - a.x) * (y - a.y) - (b.y - a.y) * (x - a.x);
    double len = hypot(b.x - a.x, b.y - a.y);
    if (fabs(cross) > EDGE_EPSILON * std::max(len, 1.0)) return false;

    return x >= std::min(a.x, b.x) - EDGE_EPSILON && x <= std::max(a.x, b.x) + EDGE_EPSILON &&
           y >= std::min(a.y, b.y) - EDGE_EPSILON && y <= std::max(a.y, b.y) + EDGE_EPSILON;
}

bool pointInPolygon(const std::vector<Point2D> &polygon, double x, double y) {
    size_t n = polygon.size();
    if (n < 3) return false;

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D &a = polygon[i];
        const Point2D &b = polygon[j];
        if (pointOnSegment(a, b, x, y)) return true;

        if ((a.y > y) != (b.y > y)) {
            double crossX = (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x;
            if (x < crossX) inside = !inside;
        }
    }
    return inside;
}

ZoneEngine::ZoneEngine(const std::vector<Zone> &zones, const ZoneEngineConfig &config)
    : config(config), zones(zones), nextAlertId(1), suppressedCount(0) {
    std::sort(this->zones.begin(), this->zones.end(),
              [](const Zone &a, const Zone &b) { return a.id < b.id; });
}

const Zone *ZoneEngine::findZone(const std::string &zoneId) const {
    for (const auto &zone : zones) {
        if (zone.id == zoneId) return &zone;
    }
    return nullptr;
}

bool ZoneEngine::emitIfCooledDown(BeaconZoneState &state, const std::string &beaconId, const Zone &zone,
                                  AlertType type, const SmoothedPosition &position, uint64_t nowMs,
                                  std::vector<ZoneAlertEvent> &events) {
    std::string key = zone.id + "/" + alertTypeName(type);

    // A clock that stepped back behind the last alert is still inside the cooldown
    auto last = state.lastEmittedMs.find(key);
    if (last != state.lastEmittedMs.end() &&
        (nowMs < last->second || nowMs - last->second < config.cooldownMs)) {
        uint64_t elapsed = nowMs >= last->second ? nowMs - last->second : 0;
        suppressedCount++;
        logPrintf("[ZONE] Suppressed %s %s/%s (%llums since last)\n", alertTypeName(type),
                  beaconId.c_str(), zone.id.c_str(), (unsigned long long)elapsed);
        return false;
    }
    state.lastEmittedMs[key] = nowMs;

    ZoneAlertEvent event;
    event.id = nextAlertId++;
    event.beaconId = beaconId;
    event.zoneId = zone.id;
    event.type = type;
    event.x = position.x;
    event.y = position.y;
    event.triggeredAtMs = nowMs;
    event.acknowledged = false;
    events.push_back(event);

    logPrintf("[ZONE] %s: beacon %s zone %s (%s) at %.2f,%.2f\n", alertTypeName(type),
              beaconId.c_str(), zone.id.c_str(), zone.name.c_str(), position.x, position.y);
    return true;
}

std::vector<ZoneAlertEvent> ZoneEngine::evaluate(const std::string &beaconId, const SmoothedPosition &position,
                                                 uint64_t nowMs) {
    std::vector<ZoneAlertEvent> events;

    auto slot = states.acquire(beaconId);
    std::lock_guard<std::mutex> lock(slot->lock);

    BeaconZoneState next = slot->value;

    for (const auto &zone : zones) {
        bool isInside = zone.floorId == position.floorId && pointInPolygon(zone.polygon, position.x, position.y);
        auto member = next.inside.find(zone.id);
        bool wasInside = member != next.inside.end();

        if (!wasInside && isInside) {
            ZoneMembership m;
            m.beaconId = beaconId;
            m.zoneId = zone.id;
            m.sinceMs = nowMs;
            m.dwellFired = false;
            next.inside[zone.id] = m;
            if (zone.alerts.onEntry) {
                emitIfCooledDown(next, beaconId, zone, ALERT_ENTRY, position, nowMs, events);
            }
        } else if (wasInside && !isInside) {
            next.inside.erase(member);
            if (zone.alerts.onExit) {
                emitIfCooledDown(next, beaconId, zone, ALERT_EXIT, position, nowMs, events);
            }
        } else if (wasInside && isInside) {
            ZoneMembership &m = member->second;
            if (zone.alerts.dwellAlert && !m.dwellFired && nowMs >= m.sinceMs &&
                nowMs - m.sinceMs >= zone.alerts.dwellThresholdMs) {
                // One dwell per stay, re-armed by the next exit; a suppressed dwell is retried
                m.dwellFired = emitIfCooledDown(next, beaconId, zone, ALERT_DWELL, position, nowMs, events);
            }
        }
    }

    slot->value = next;
    slot->occupied = true;
    return events;
}

std::vector<ZoneMembership> ZoneEngine::memberships(const std::string &beaconId) const {
    std::vector<ZoneMembership> out;
    auto slot = states.find(beaconId);
    if (!slot) return out;

    std::lock_guard<std::mutex> lock(slot->lock);
    for (const auto &entry : slot->value.inside) out.push_back(entry.second);
    return out;
}

}  // namespace beacontrack
