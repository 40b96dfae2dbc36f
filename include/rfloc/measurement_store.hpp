#pragma once
#include "rfloc/types.hpp"
#include <optional>
#include <vector>

namespace rfloc {

struct Bounds {
    double x_min = 0.0, x_max = 0.0;
    double y_min = 0.0, y_max = 0.0;
};

// Noktaların koordinat uç değerleri; boşsa nullopt
std::optional<Bounds> bounds_of(const std::vector<MeasurementPoint>& points);

// Ölçüm noktalarının sıralı deposu; çekirdeğin tek değişken durumu
class MeasurementStore {
public:
    // Ekler ve saklanan kopyayı döndürür (zaman damgası ekleme anında)
    MeasurementPoint add(double x, double y, double rssi, double frequency);
    void clear() { points_.clear(); }

    const std::vector<MeasurementPoint>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    std::optional<Bounds> bounds() const { return bounds_of(points_); }

private:
    std::vector<MeasurementPoint> points_;
};

} // namespace rfloc
