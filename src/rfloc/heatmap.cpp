#include "rfloc/heatmap.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace rfloc {

namespace {

// numpy.linspace ile aynı: uçlar dahil
double lin(double lo, double hi, int i, int n) {
    if (n <= 1) return lo;
    return lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
}

} // namespace

double HeatmapGrid::x_at(int col) const {
    return lin(bounds.x_min, bounds.x_max, col, values.cols);
}

double HeatmapGrid::y_at(int row) const {
    return lin(bounds.y_min, bounds.y_max, row, values.rows);
}

Bounds HeatmapRenderer::area(const std::vector<MeasurementPoint>& points) const {
    const auto ext = bounds_of(points);
    if (!ext) return Bounds{0.0, cfg_.default_extent, 0.0, cfg_.default_extent};

    // Tek pay, x aralığından; iki eksene de uygulanır.
    // x sabitse y aralığı, tek noktada varsayılan alanın payı kullanılır.
    Bounds b = *ext;
    double m = (b.x_max - b.x_min) * cfg_.margin_ratio;
    if (m <= 0.0) m = (b.y_max - b.y_min) * cfg_.margin_ratio;
    if (m <= 0.0) m = cfg_.default_extent * cfg_.margin_ratio;
    b.x_min -= m;  b.x_max += m;
    b.y_min -= m;  b.y_max += m;
    return b;
}

HeatmapGrid HeatmapRenderer::render(const std::vector<InterferenceSource>& sources,
                                    const std::vector<MeasurementPoint>& points,
                                    int grid_size) const {
    HeatmapGrid g;
    g.bounds = area(points);
    if (grid_size <= 0) return g;

    g.values = cv::Mat1d::zeros(grid_size, grid_size);

    // Yalnızca konumu bilinen kaynaklar katkı verir
    struct Emitter { double x, y, weight; };
    std::vector<Emitter> emitters;
    for (const auto& s : sources) {
        if (!s.location) continue;
        emitters.push_back({s.location->x, s.location->y,
                            s.location_confidence * (s.severity_score() / 100.0)});
    }
    if (emitters.empty()) return g;

    auto fill_rows = [&](const cv::Range& rows) {
        for (int r = rows.start; r < rows.end; ++r) {
            const double y = g.y_at(r);
            double* row = g.values.ptr<double>(r);
            for (int c = 0; c < grid_size; ++c) {
                const double x = g.x_at(c);
                double acc = 0.0;
                for (const auto& e : emitters) {
                    const double d = std::max(cfg_.min_distance, std::hypot(x - e.x, y - e.y));
                    acc += model_.distance_to_rssi(d) * e.weight;
                }
                row[c] = acc;
            }
        }
    };

    // Satırlar birbirinden bağımsız
    if (grid_size >= cfg_.parallel_min_rows)
        cv::parallel_for_(cv::Range(0, grid_size), fill_rows);
    else
        fill_rows(cv::Range(0, grid_size));

    return g;
}

bool write_csv(const HeatmapGrid& g, const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "w");
    if (!f) {
        std::fprintf(stderr, "[ERR] cannot open %s for writing\n", path.c_str());
        return false;
    }
    std::fprintf(f, "y\\x");
    for (int c = 0; c < g.values.cols; ++c) std::fprintf(f, ",%.3f", g.x_at(c));
    std::fprintf(f, "\n");
    for (int r = 0; r < g.values.rows; ++r) {
        std::fprintf(f, "%.3f", g.y_at(r));
        const double* row = g.values.ptr<double>(r);
        for (int c = 0; c < g.values.cols; ++c) std::fprintf(f, ",%.4f", row[c]);
        std::fprintf(f, "\n");
    }
    const bool ok = std::ferror(f) == 0;
    std::fclose(f);
    return ok;
}

} // namespace rfloc
