#include "temporal_smoother.h"
#include <cmath>

namespace beacontrack {

SmootherConfig defaultSmootherConfig() {
    SmootherConfig config;
    config.alpha = 0.3;
    config.stabilityDistance = 0.5;
    config.driftWindowMs = 10000;
    config.staleTrackMs = 60000;
    config.velocityDecay = 0.5;
    config.minHeadingSpeed = 0.01;
    return config;
}

static double headingDegrees(double vx, double vy) {
    double heading = atan2(vy, vx) * 180.0 / M_PI;
    if (heading < 0.0) heading += 360.0;
    if (heading >= 360.0) heading -= 360.0;
    return heading;
}

SmootherTrack seedTrack(const PositionEstimate &raw) {
    SmootherTrack track;
    SmoothedPosition &s = track.current;
    s.beaconId = raw.beaconId;
    s.floorId = raw.floorId;
    s.x = raw.x;
    s.y = raw.y;
    s.velocityX = 0.0;
    s.velocityY = 0.0;
    s.speed = 0.0;
    s.heading = 0.0;
    s.hasHeading = false;  // no motion observed yet
    s.accuracy = raw.accuracy;
    s.method = raw.method;
    s.updatedAtMs = raw.computedAtMs;
    track.lastAdvanceMs = raw.computedAtMs;
    return track;
}

SmootherTrack advanceTrack(const SmootherTrack &previous, const PositionEstimate &raw,
                           const SmootherConfig &config) {
    const SmoothedPosition &prev = previous.current;

    if (raw.computedAtMs <= prev.updatedAtMs) {
        return previous;  // out of order
    }
    if (raw.floorId != prev.floorId || raw.computedAtMs - prev.updatedAtMs > config.staleTrackMs) {
        return seedTrack(raw);
    }

    SmootherTrack next = previous;
    SmoothedPosition &s = next.current;
    s.updatedAtMs = raw.computedAtMs;
    s.method = raw.method;
    s.accuracy = config.alpha * raw.accuracy + (1.0 - config.alpha) * prev.accuracy;

    double moved = hypot(raw.x - prev.x, raw.y - prev.y);
    uint64_t heldFor = raw.computedAtMs - previous.lastAdvanceMs;

    if (moved < config.stabilityDistance && heldFor < config.driftWindowMs) {
        // Jitter around a stationary beacon: hold position, let velocity die out
        s.velocityX = prev.velocityX * config.velocityDecay;
        s.velocityY = prev.velocityY * config.velocityDecay;
        s.speed = hypot(s.velocityX, s.velocityY);
        if (s.speed < config.minHeadingSpeed) {
            s.velocityX = 0.0;
            s.velocityY = 0.0;
            s.speed = 0.0;
            s.hasHeading = false;
        }
        return next;
    }

    s.x = config.alpha * raw.x + (1.0 - config.alpha) * prev.x;
    s.y = config.alpha * raw.y + (1.0 - config.alpha) * prev.y;

    double dt = heldFor / 1000.0;
    s.velocityX = (s.x - prev.x) / dt;
    s.velocityY = (s.y - prev.y) / dt;
    s.speed = hypot(s.velocityX, s.velocityY);
    if (s.speed >= config.minHeadingSpeed) {
        s.heading = headingDegrees(s.velocityX, s.velocityY);
        s.hasHeading = true;
    } else {
        s.hasHeading = false;
    }

    next.lastAdvanceMs = raw.computedAtMs;
    return next;
}

TemporalSmoother::TemporalSmoother(const SmootherConfig &config) : config(config) {}

SmoothedPosition TemporalSmoother::update(const std::string &beaconId, const PositionEstimate &raw) {
    auto slot = tracks.acquire(beaconId);
    std::lock_guard<std::mutex> lock(slot->lock);

    SmootherTrack next = slot->occupied ? advanceTrack(slot->value, raw, config) : seedTrack(raw);
    next.current.beaconId = beaconId;

    slot->value = next;
    slot->occupied = true;
    return next.current;
}

bool TemporalSmoother::getSmoothedPosition(const std::string &beaconId, SmoothedPosition &out) const {
    auto slot = tracks.find(beaconId);
    if (!slot) return false;

    std::lock_guard<std::mutex> lock(slot->lock);
    if (!slot->occupied) return false;
    out = slot->value.current;
    return true;
}

size_t TemporalSmoother::trackCount() const {
    return tracks.size();
}

}  // namespace beacontrack
