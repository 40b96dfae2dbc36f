#pragma once
#include "rfloc/config.hpp"

namespace rfloc {

// Log-mesafe yol kaybı modeli: RSSI(d) = RSSI0 - 10 n log10(d / d0)
class PathLossModel {
public:
    // Geçersiz konfigürasyonda InvalidConfig fırlatır
    explicit PathLossModel(const PathLossConfig& cfg = {});

    // Kalibrasyon noktasından daha yakın mesafe raporlanmaz
    double rssi_to_distance(double rssi_dbm) const;
    double distance_to_rssi(double distance_m) const;

    const PathLossConfig& config() const { return cfg_; }

private:
    PathLossConfig cfg_;
};

} // namespace rfloc
