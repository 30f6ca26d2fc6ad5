#pragma once
#include "types.h"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace beacontrack {

// Floors, gateways, beacons and zones known to the pipeline. Everything but
// beacons is fixed after configuration load; beacons may be added at run time
// by auto-discovery, so all lookups go through the registry mutex.
class SiteRegistry {
private:
    mutable std::mutex registryMutex;
    std::map<std::string, Floor> floors;
    std::map<std::string, Gateway> gateways;
    std::map<std::string, std::string> gatewayIdByMac;
    std::map<std::string, Beacon> beacons;
    std::map<std::string, std::string> beaconIdByMac;
    std::vector<Zone> zones;

public:
    bool addFloor(const Floor &floor);
    // Rejects unknown floors, positions outside the floor and duplicate ids or MACs.
    bool addGateway(const Gateway &gateway);
    bool addBeacon(const Beacon &beacon);
    bool addZone(const Zone &zone);

    bool findFloor(const std::string &id, Floor &out) const;
    bool findGateway(const std::string &id, Gateway &out) const;
    bool findGatewayByMac(const std::string &mac, Gateway &out) const;
    bool findBeacon(const std::string &id, Beacon &out) const;
    bool findBeaconByMac(const std::string &mac, Beacon &out) const;
    bool findZone(const std::string &id, Zone &out) const;

    // Registers an unknown MAC as "Auto-<last 8 chars>" of type Device.
    // Yields the existing beacon when another task registered it first.
    bool discoverBeacon(const std::string &mac, Beacon &out);

    std::vector<Gateway> getGateways() const;
    std::vector<Zone> getZones() const;
    size_t gatewayCount() const;
    size_t beaconCount() const;
};

}  // namespace beacontrack
