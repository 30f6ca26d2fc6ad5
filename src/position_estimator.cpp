#include "position_estimator.h"
#include <algorithm>
#include <cmath>

namespace beacontrack {

static const double MIN_RANGE = 1e-6;
static const int MAX_STEP_HALVINGS = 12;

EstimatorConfig defaultEstimatorConfig() {
    EstimatorConfig config;
    config.maxIterations = 100;
    config.convergenceEpsilon = 1e-6;
    config.minAccuracy = 0.1;
    config.degradedAccuracyFactor = 1.5;
    config.nonConvergedAccuracyFactor = 2.0;
    config.collinearityRatio = 1e-3;
    return config;
}

EstimationMethod selectEstimationMethod(size_t gatewayCount) {
    if (gatewayCount < 2) return METHOD_NONE;
    if (gatewayCount == 2) return METHOD_TWO_POINT;
    return METHOD_LEAST_SQUARES;
}

// Smallest vs largest eigenvalue of the gateway scatter matrix
bool gatewaysCollinear(const std::vector<GatewayDistance> &gateways, double ratio) {
    if (gateways.size() < 3) return true;

    double mx = 0, my = 0;
    for (const auto &g : gateways) {
        mx += g.x;
        my += g.y;
    }
    mx /= gateways.size();
    my /= gateways.size();

    double sxx = 0, syy = 0, sxy = 0;
    for (const auto &g : gateways) {
        double dx = g.x - mx;
        double dy = g.y - my;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }

    double trace = sxx + syy;
    if (trace < 1e-12) return true;  // all at one point

    double disc = sqrt((sxx - syy) * (sxx - syy) + 4.0 * sxy * sxy);
    double lambdaMax = 0.5 * (trace + disc);
    double lambdaMin = 0.5 * (trace - disc);
    return lambdaMin <= ratio * lambdaMax;
}

// sum w_i * (|P - G_i| - d_i)^2, w_i = 1/d_i^2
double weightedResidualCost(const std::vector<GatewayDistance> &gateways, double x, double y) {
    double cost = 0.0;
    for (const auto &g : gateways) {
        double range = hypot(x - g.x, y - g.y);
        double r = range - g.distance;
        cost += r * r / (g.distance * g.distance);
    }
    return cost;
}

static double rmsResidual(const std::vector<GatewayDistance> &gateways, double x, double y) {
    double sum = 0.0;
    for (const auto &g : gateways) {
        double r = hypot(x - g.x, y - g.y) - g.distance;
        sum += r * r;
    }
    return sqrt(sum / gateways.size());
}

EstimateStatus estimateTwoPoint(const GatewayDistance &g1, const GatewayDistance &g2,
                                const EstimatorConfig &config, PositionEstimate &out) {
    double dx = g2.x - g1.x;
    double dy = g2.y - g1.y;
    double sep = hypot(dx, dy);
    double r1 = g1.distance;
    double r2 = g2.distance;

    out.method = METHOD_TWO_POINT;
    out.gatewayCount = 2;
    out.iterations = 0;

    if (sep < MIN_RANGE) {
        out.x = g1.x;
        out.y = g1.y;
        out.accuracy = std::max(0.5 * (r1 + r2), config.minAccuracy) * config.degradedAccuracyFactor;
        out.status = ESTIMATE_DEGENERATE;
        return out.status;
    }

    if (sep > r1 + r2 || sep < fabs(r1 - r2)) {
        // No intersection: inverse-distance weighted point on the baseline
        double w1 = 1.0 / r1;
        double w2 = 1.0 / r2;
        out.x = (g1.x * w1 + g2.x * w2) / (w1 + w2);
        out.y = (g1.y * w1 + g2.y * w2) / (w1 + w2);

        double gap = sep > r1 + r2 ? sep - (r1 + r2) : fabs(r1 - r2) - sep;
        out.accuracy = std::max(std::max(0.5 * (r1 + r2), gap), config.minAccuracy) *
                       config.degradedAccuracyFactor;
        out.status = ESTIMATE_DEGENERATE;
        return out.status;
    }

    // Two intersections mirrored about the baseline; report the chord
    // midpoint with the half-chord as the uncertainty.
    double a = (r1 * r1 - r2 * r2 + sep * sep) / (2.0 * sep);
    double h = sqrt(std::max(r1 * r1 - a * a, 0.0));

    out.x = g1.x + a * dx / sep;
    out.y = g1.y + a * dy / sep;
    out.accuracy = std::max(h, config.minAccuracy);
    out.status = ESTIMATE_OK;
    return out.status;
}

EstimateStatus estimateLeastSquares(const std::vector<GatewayDistance> &gateways,
                                    const EstimatorConfig &config, PositionEstimate &out) {
    // Start at the inverse-distance weighted centroid
    double x = 0, y = 0, sumW = 0;
    for (const auto &g : gateways) {
        double w = 1.0 / g.distance;
        x += g.x * w;
        y += g.y * w;
        sumW += w;
    }
    x /= sumW;
    y /= sumW;

    double cost = weightedResidualCost(gateways, x, y);
    bool converged = false;
    uint32_t iter = 0;

    for (; iter < config.maxIterations; iter++) {
        double jtwj00 = 0, jtwj01 = 0, jtwj11 = 0;
        double jtwr0 = 0, jtwr1 = 0;

        for (const auto &g : gateways) {
            double ex = x - g.x;
            double ey = y - g.y;
            double range = hypot(ex, ey);
            if (range < MIN_RANGE) continue;  // gradient undefined on the gateway itself

            double w = 1.0 / (g.distance * g.distance);
            double jx = ex / range;
            double jy = ey / range;
            double r = range - g.distance;

            jtwj00 += w * jx * jx;
            jtwj01 += w * jx * jy;
            jtwj11 += w * jy * jy;
            jtwr0 += w * jx * r;
            jtwr1 += w * jy * r;
        }

        double lambda = 1e-9 * (jtwj00 + jtwj11) + 1e-12;
        double a = jtwj00 + lambda;
        double c = jtwj11 + lambda;
        double det = a * c - jtwj01 * jtwj01;
        if (det < 1e-18) break;

        double stepX = -(c * jtwr0 - jtwj01 * jtwr1) / det;
        double stepY = -(a * jtwr1 - jtwj01 * jtwr0) / det;

        // Halve the step until the cost stops increasing
        bool accepted = false;
        for (int k = 0; k < MAX_STEP_HALVINGS; k++) {
            double candidateCost = weightedResidualCost(gateways, x + stepX, y + stepY);
            if (candidateCost <= cost) {
                x += stepX;
                y += stepY;
                cost = candidateCost;
                accepted = true;
                break;
            }
            stepX *= 0.5;
            stepY *= 0.5;
        }

        if (!accepted || hypot(stepX, stepY) < config.convergenceEpsilon) {
            converged = true;
            iter++;
            break;
        }
    }

    out.x = x;
    out.y = y;
    out.method = METHOD_LEAST_SQUARES;
    out.gatewayCount = (uint32_t)gateways.size();
    out.iterations = iter;
    out.accuracy = std::max(rmsResidual(gateways, x, y), config.minAccuracy);
    out.status = ESTIMATE_OK;

    if (!converged) {
        out.accuracy *= config.nonConvergedAccuracyFactor;
        out.status = ESTIMATE_NOT_CONVERGED;
    }
    if (gatewaysCollinear(gateways, config.collinearityRatio)) {
        out.accuracy *= config.degradedAccuracyFactor;
        out.status = ESTIMATE_DEGENERATE;
    }
    return out.status;
}

EstimateStatus estimatePosition(const std::string &beaconId, std::vector<GatewayDistance> distances,
                                const EstimatorConfig &config, PositionEstimate &out) {
    std::sort(distances.begin(), distances.end(),
              [](const GatewayDistance &a, const GatewayDistance &b) {
                  return a.gatewayId < b.gatewayId;
              });
    for (auto &d : distances) {
        if (!(d.distance > MIN_RANGE)) d.distance = MIN_RANGE;
    }

    out.beaconId = beaconId;
    out.gatewayCount = (uint32_t)distances.size();
    out.iterations = 0;
    out.method = selectEstimationMethod(distances.size());

    switch (out.method) {
        case METHOD_TWO_POINT:
            return estimateTwoPoint(distances[0], distances[1], config, out);
        case METHOD_LEAST_SQUARES:
            return estimateLeastSquares(distances, config, out);
        case METHOD_NONE:
            break;
    }

    out.x = 0.0;
    out.y = 0.0;
    out.accuracy = 0.0;
    out.status = ESTIMATE_INSUFFICIENT;
    return out.status;
}

}  // namespace beacontrack
