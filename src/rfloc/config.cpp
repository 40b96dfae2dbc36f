#include "rfloc/config.hpp"
#include <cmath>
#include <cstdio>

namespace rfloc {

void validate(const PathLossConfig& cfg) {
    char msg[128];
    if (!std::isfinite(cfg.exponent) || cfg.exponent <= 0.0) {
        std::snprintf(msg, sizeof(msg), "path loss exponent must be > 0 (got %g)", cfg.exponent);
        throw InvalidConfig(msg);
    }
    if (!std::isfinite(cfg.reference_distance) || cfg.reference_distance <= 0.0) {
        std::snprintf(msg, sizeof(msg), "reference distance must be > 0 (got %g)", cfg.reference_distance);
        throw InvalidConfig(msg);
    }
    if (!std::isfinite(cfg.reference_rssi)) {
        throw InvalidConfig("reference rssi must be finite");
    }
}

} // namespace rfloc
