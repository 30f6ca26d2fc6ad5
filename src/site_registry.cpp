#include "site_registry.h"
#include "log.h"
#include "mac_address.h"

namespace beacontrack {

bool SiteRegistry::addFloor(const Floor &floor) {
    std::lock_guard<std::mutex> lock(registryMutex);
    if (floor.id.empty() || floors.count(floor.id)) {
        logPrintf("[CONFIG] Floor '%s' rejected: empty or duplicate id\n", floor.id.c_str());
        return false;
    }
    if (floor.width <= 0.0 || floor.height <= 0.0) {
        logPrintf("[CONFIG] Floor '%s' rejected: bad dimensions %.1fx%.1f\n",
                  floor.id.c_str(), floor.width, floor.height);
        return false;
    }
    floors[floor.id] = floor;
    return true;
}

bool SiteRegistry::addGateway(const Gateway &gateway) {
    std::lock_guard<std::mutex> lock(registryMutex);

    std::string mac;
    if (gateway.id.empty() || !normalizeMac(gateway.mac, mac)) {
        logPrintf("[CONFIG] Gateway '%s' rejected: bad id or MAC '%s'\n",
                  gateway.id.c_str(), gateway.mac.c_str());
        return false;
    }
    if (gateways.count(gateway.id) || gatewayIdByMac.count(mac)) {
        logPrintf("[CONFIG] Gateway '%s' rejected: duplicate id or MAC\n", gateway.id.c_str());
        return false;
    }

    auto floor = floors.find(gateway.floorId);
    if (floor == floors.end()) {
        logPrintf("[CONFIG] Gateway '%s' rejected: unknown floor '%s'\n",
                  gateway.id.c_str(), gateway.floorId.c_str());
        return false;
    }
    if (gateway.x < 0.0 || gateway.y < 0.0 || gateway.x > floor->second.width ||
        gateway.y > floor->second.height) {
        logPrintf("[CONFIG] WARNING: gateway '%s' at %.2f,%.2f outside floor '%s' (%.1fx%.1f), ignored\n",
                  gateway.id.c_str(), gateway.x, gateway.y, floor->second.id.c_str(),
                  floor->second.width, floor->second.height);
        return false;
    }

    Gateway stored = gateway;
    stored.mac = mac;
    gateways[stored.id] = stored;
    gatewayIdByMac[mac] = stored.id;
    return true;
}

bool SiteRegistry::addBeacon(const Beacon &beacon) {
    std::lock_guard<std::mutex> lock(registryMutex);

    std::string mac;
    if (beacon.id.empty() || !normalizeMac(beacon.mac, mac)) {
        logPrintf("[CONFIG] Beacon '%s' rejected: bad id or MAC '%s'\n",
                  beacon.id.c_str(), beacon.mac.c_str());
        return false;
    }
    if (beacons.count(beacon.id) || beaconIdByMac.count(mac)) {
        logPrintf("[CONFIG] Beacon '%s' rejected: duplicate id or MAC\n", beacon.id.c_str());
        return false;
    }

    Beacon stored = beacon;
    stored.mac = mac;
    if (stored.name.empty()) stored.name = stored.id;
    if (stored.resourceType.empty()) stored.resourceType = "Device";
    beacons[stored.id] = stored;
    beaconIdByMac[mac] = stored.id;
    return true;
}

bool SiteRegistry::addZone(const Zone &zone) {
    std::lock_guard<std::mutex> lock(registryMutex);
    if (zone.id.empty() || zone.polygon.size() < 3) {
        logPrintf("[CONFIG] Zone '%s' rejected: needs an id and at least 3 vertices (has %u)\n",
                  zone.id.c_str(), (unsigned)zone.polygon.size());
        return false;
    }
    if (!floors.count(zone.floorId)) {
        logPrintf("[CONFIG] Zone '%s' rejected: unknown floor '%s'\n", zone.id.c_str(), zone.floorId.c_str());
        return false;
    }
    for (const auto &existing : zones) {
        if (existing.id == zone.id) {
            logPrintf("[CONFIG] Zone '%s' rejected: duplicate id\n", zone.id.c_str());
            return false;
        }
    }
    zones.push_back(zone);
    return true;
}

bool SiteRegistry::findFloor(const std::string &id, Floor &out) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = floors.find(id);
    if (it == floors.end()) return false;
    out = it->second;
    return true;
}

bool SiteRegistry::findGateway(const std::string &id, Gateway &out) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = gateways.find(id);
    if (it == gateways.end()) return false;
    out = it->second;
    return true;
}

bool SiteRegistry::findGatewayByMac(const std::string &mac, Gateway &out) const {
    std::string normalized;
    if (!normalizeMac(mac, normalized)) return false;

    std::lock_guard<std::mutex> lock(registryMutex);
    auto id = gatewayIdByMac.find(normalized);
    if (id == gatewayIdByMac.end()) return false;
    out = gateways.at(id->second);
    return true;
}

bool SiteRegistry::findBeacon(const std::string &id, Beacon &out) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = beacons.find(id);
    if (it == beacons.end()) return false;
    out = it->second;
    return true;
}

bool SiteRegistry::findBeaconByMac(const std::string &mac, Beacon &out) const {
    std::string normalized;
    if (!normalizeMac(mac, normalized)) return false;

    std::lock_guard<std::mutex> lock(registryMutex);
    auto id = beaconIdByMac.find(normalized);
    if (id == beaconIdByMac.end()) return false;
    out = beacons.at(id->second);
    return true;
}

bool SiteRegistry::findZone(const std::string &id, Zone &out) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    for (const auto &zone : zones) {
        if (zone.id == id) {
            out = zone;
            return true;
        }
    }
    return false;
}

bool SiteRegistry::discoverBeacon(const std::string &mac, Beacon &out) {
    std::string normalized;
    if (!normalizeMac(mac, normalized)) return false;

    std::lock_guard<std::mutex> lock(registryMutex);
    auto existing = beaconIdByMac.find(normalized);
    if (existing != beaconIdByMac.end()) {
        out = beacons.at(existing->second);
        return true;
    }

    Beacon beacon;
    beacon.id = "auto-" + compactMac(normalized);
    beacon.mac = normalized;
    beacon.name = "Auto-" + (normalized.length() > 8 ? normalized.substr(normalized.length() - 8) : normalized);
    beacon.resourceType = "Device";

    beacons[beacon.id] = beacon;
    beaconIdByMac[normalized] = beacon.id;
    logPrintf("[INGEST] Discovered beacon %s as '%s'\n", normalized.c_str(), beacon.name.c_str());
    out = beacon;
    return true;
}

std::vector<Gateway> SiteRegistry::getGateways() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    std::vector<Gateway> out;
    for (const auto &entry : gateways) out.push_back(entry.second);
    return out;
}

std::vector<Zone> SiteRegistry::getZones() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return zones;
}

size_t SiteRegistry::gatewayCount() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return gateways.size();
}

size_t SiteRegistry::beaconCount() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return beacons.size();
}

}  // namespace beacontrack
