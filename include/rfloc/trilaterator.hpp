#pragma once
#include "rfloc/path_loss.hpp"
#include "rfloc/types.hpp"
#include <optional>
#include <vector>

namespace rfloc {

struct Fix {
    double x, y, confidence;
};

struct TrilatConfig {
    double det_eps      = 1e-10;  // |det| bunun altındaysa noktalar eşdoğrusal
    double w_geometric  = 0.5;
    double w_signal     = 0.3;
    double w_count      = 0.2;
    double rssi_floor   = -80.0;  // signal_factor = 0
    double rssi_ceil    = -40.0;  // signal_factor = 1
    int    full_count   = 5;      // count_factor = 1
};

// En güçlü 3 ölçümden üç kenar konumlama + GDOP benzeri güven skoru
class Trilaterator {
public:
    explicit Trilaterator(PathLossModel model, const TrilatConfig& cfg = {})
      : model_(model), cfg_(cfg) {}

    // <3 nokta veya eşdoğrusal geometri -> nullopt (hata değil)
    std::optional<Fix> triangulate(const std::vector<MeasurementPoint>& points) const;

    // anchors: kullanılan 3 nokta, cluster: kümenin tamamı
    double confidence(const std::vector<MeasurementPoint>& anchors,
                      const std::vector<MeasurementPoint>& cluster,
                      double x, double y) const;

private:
    PathLossModel model_;
    TrilatConfig cfg_;
};

} // namespace rfloc
