#pragma once
#include "types.h"
#include <string>
#include <vector>

namespace beacontrack {

struct GatewayDistance {
    std::string gatewayId;
    double x;
    double y;
    double distance;
};

struct EstimatorConfig {
    uint32_t maxIterations;
    double convergenceEpsilon;
    double minAccuracy;
    double degradedAccuracyFactor;
    double nonConvergedAccuracyFactor;
    double collinearityRatio;
};

EstimatorConfig defaultEstimatorConfig();

// Pure function of gateway count: <2 none, 2 two-point, >=3 least squares.
EstimationMethod selectEstimationMethod(size_t gatewayCount);

bool gatewaysCollinear(const std::vector<GatewayDistance> &gateways, double ratio);
double weightedResidualCost(const std::vector<GatewayDistance> &gateways, double x, double y);

// Fills out.x/y/accuracy/method/status/gatewayCount/iterations. Gateways are
// processed in id order so identical inputs give bit-identical results.
EstimateStatus estimatePosition(const std::string &beaconId, std::vector<GatewayDistance> distances,
                                const EstimatorConfig &config, PositionEstimate &out);

EstimateStatus estimateTwoPoint(const GatewayDistance &g1, const GatewayDistance &g2,
                                const EstimatorConfig &config, PositionEstimate &out);
EstimateStatus estimateLeastSquares(const std::vector<GatewayDistance> &gateways,
                                    const EstimatorConfig &config, PositionEstimate &out);

}  // namespace beacontrack
