#include "rfloc/path_loss.hpp"
#include <cmath>

namespace rfloc {

PathLossModel::PathLossModel(const PathLossConfig& cfg) : cfg_(cfg) {
    validate(cfg_);
}

double PathLossModel::rssi_to_distance(double rssi_dbm) const {
    if (rssi_dbm >= cfg_.reference_rssi) return cfg_.reference_distance;
    const double e = (cfg_.reference_rssi - rssi_dbm) / (10.0 * cfg_.exponent);
    return cfg_.reference_distance * std::pow(10.0, e);
}

double PathLossModel::distance_to_rssi(double distance_m) const {
    if (distance_m <= 0.0) return cfg_.reference_rssi;
    return cfg_.reference_rssi
         - 10.0 * cfg_.exponent * std::log10(distance_m / cfg_.reference_distance);
}

} // namespace rfloc
