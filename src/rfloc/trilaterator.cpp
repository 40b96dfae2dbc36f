#include "rfloc/trilaterator.hpp"
#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace rfloc {

std::optional<Fix> Trilaterator::triangulate(const std::vector<MeasurementPoint>& points) const {
    if (points.size() < 3) return std::nullopt;

    // En güçlü 3 sinyal (eşitlikte orijinal sıra)
    std::vector<MeasurementPoint> anchors(points);
    std::stable_sort(anchors.begin(), anchors.end(),
                     [](const MeasurementPoint& a, const MeasurementPoint& b) {
                         return a.rssi > b.rssi;
                     });
    anchors.resize(3);

    const double x1 = anchors[0].x, y1 = anchors[0].y;
    const double x2 = anchors[1].x, y2 = anchors[1].y;
    const double x3 = anchors[2].x, y3 = anchors[2].y;
    const double r1 = model_.rssi_to_distance(anchors[0].rssi);
    const double r2 = model_.rssi_to_distance(anchors[1].rssi);
    const double r3 = model_.rssi_to_distance(anchors[2].rssi);

    // Çember denklemlerinin ikili farkları -> 2x2 lineer sistem
    const cv::Matx22d A(2.0 * (x2 - x1), 2.0 * (y2 - y1),
                        2.0 * (x3 - x2), 2.0 * (y3 - y2));
    const cv::Vec2d rhs(r1*r1 - r2*r2 - x1*x1 + x2*x2 - y1*y1 + y2*y2,
                        r2*r2 - r3*r3 - x2*x2 + x3*x3 - y2*y2 + y3*y3);

    if (std::fabs(cv::determinant(A)) < cfg_.det_eps) return std::nullopt;

    const cv::Vec2d sol = A.solve(rhs, cv::DECOMP_LU);
    if (!std::isfinite(sol[0]) || !std::isfinite(sol[1])) return std::nullopt;

    return Fix{sol[0], sol[1], confidence(anchors, points, sol[0], sol[1])};
}

double Trilaterator::confidence(const std::vector<MeasurementPoint>& anchors,
                                const std::vector<MeasurementPoint>& cluster,
                                double x, double y) const {
    if (anchors.empty() || cluster.empty()) return 0.0;

    // 1) Geometri: tahmin noktasından görülen açıların düzgünlüğü
    std::vector<double> angles;
    angles.reserve(anchors.size());
    for (const auto& p : anchors) angles.push_back(std::atan2(p.y - y, p.x - x));
    std::sort(angles.begin(), angles.end());

    const double two_pi = 2.0 * CV_PI;
    const double ideal  = two_pi / static_cast<double>(angles.size());
    double variance = 0.0;
    for (size_t i = 0; i < angles.size(); ++i) {
        double gap = angles[(i + 1) % angles.size()] - angles[i];
        if (gap < 0.0) gap += two_pi;
        variance += (gap - ideal) * (gap - ideal);
    }
    const double geometric = 1.0 / (1.0 + variance / (ideal * ideal));

    // 2) Sinyal gücü: küme ortalaması [-80, -40] -> [0, 1]
    double sum = 0.0;
    for (const auto& p : cluster) sum += p.rssi;
    const double avg = sum / static_cast<double>(cluster.size());
    const double signal = std::clamp((avg - cfg_.rssi_floor) / (cfg_.rssi_ceil - cfg_.rssi_floor),
                                     0.0, 1.0);

    // 3) Örnek sayısı
    const double count = std::min(1.0, static_cast<double>(cluster.size()) / cfg_.full_count);

    const double c = cfg_.w_geometric * geometric + cfg_.w_signal * signal + cfg_.w_count * count;
    return std::clamp(c, 0.0, 1.0);
}

} // namespace rfloc
