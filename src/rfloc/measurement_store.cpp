#include "rfloc/measurement_store.hpp"
#include <algorithm>

namespace rfloc {

MeasurementPoint MeasurementStore::add(double x, double y, double rssi, double frequency) {
    MeasurementPoint p;
    p.x = x;
    p.y = y;
    p.rssi = rssi;
    p.frequency = frequency;
    p.timestamp = sys_clock::now();
    points_.push_back(p);
    return p;
}

std::optional<Bounds> bounds_of(const std::vector<MeasurementPoint>& points) {
    if (points.empty()) return std::nullopt;
    Bounds b{points.front().x, points.front().x, points.front().y, points.front().y};
    for (const auto& p : points) {
        b.x_min = std::min(b.x_min, p.x);
        b.x_max = std::max(b.x_max, p.x);
        b.y_min = std::min(b.y_min, p.y);
        b.y_max = std::max(b.y_max, p.y);
    }
    return b;
}

} // namespace rfloc
