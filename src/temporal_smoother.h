#pragma once
#include "keyed_arena.h"
#include "types.h"
#include <string>

namespace beacontrack {

struct SmootherConfig {
    double alpha;                 // weight of the new raw estimate
    double stabilityDistance;     // moves below this are noise...
    uint32_t driftWindowMs;       // ...unless the position has been held this long
    uint32_t staleTrackMs;        // gap after which a track is re-seeded
    double velocityDecay;         // per held update
    double minHeadingSpeed;
};

SmootherConfig defaultSmootherConfig();

struct SmootherTrack {
    SmoothedPosition current;
    uint64_t lastAdvanceMs;       // when current.x/y last moved
};

SmootherTrack seedTrack(const PositionEstimate &raw);
SmootherTrack advanceTrack(const SmootherTrack &previous, const PositionEstimate &raw,
                           const SmootherConfig &config);

class TemporalSmoother {
private:
    SmootherConfig config;
    KeyedArena<SmootherTrack> tracks;

public:
    explicit TemporalSmoother(const SmootherConfig &config);

    // Replaces the beacon's track with a new value under the beacon's slot
    // lock; the previous value is never modified.
    SmoothedPosition update(const std::string &beaconId, const PositionEstimate &raw);
    bool getSmoothedPosition(const std::string &beaconId, SmoothedPosition &out) const;
    size_t trackCount() const;
};

}  // namespace beacontrack
