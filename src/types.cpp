#include "types.h"

namespace beacontrack {

const char *alertTypeName(AlertType type) {
    switch (type) {
        case ALERT_ENTRY: return "entry";
        case ALERT_EXIT:  return "exit";
        case ALERT_DWELL: return "dwell";
    }
    return "unknown";
}

const char *estimationMethodName(EstimationMethod method) {
    switch (method) {
        case METHOD_TWO_POINT:     return "two_point";
        case METHOD_LEAST_SQUARES: return "least_squares";
        case METHOD_NONE:          break;
    }
    return "none";
}

const char *estimateStatusName(EstimateStatus status) {
    switch (status) {
        case ESTIMATE_OK:            return "ok";
        case ESTIMATE_INSUFFICIENT:  return "insufficient_gateways";
        case ESTIMATE_DEGENERATE:    return "degenerate_geometry";
        case ESTIMATE_NOT_CONVERGED: return "non_convergence";
    }
    return "unknown";
}

}  // namespace beacontrack
