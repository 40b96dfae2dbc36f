#pragma once
#include "rfloc/measurement_store.hpp"
#include "rfloc/path_loss.hpp"
#include "rfloc/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace rfloc {

struct HeatmapConfig {
    double margin_ratio      = 0.1;   // x aralığının %10'u, iki eksene
    double min_distance      = 0.1;   // m, kaynak üstünde tekillik olmasın
    double default_extent    = 10.0;  // ölçüm yoksa 0..10 m
    int    parallel_min_rows = 64;    // bu boyuttan itibaren satırlar paralel
};

struct HeatmapGrid {
    cv::Mat1d values;   // rows: y, cols: x
    Bounds    bounds;

    // values(r, c) hücresinin metre cinsinden koordinatı
    double x_at(int col) const;
    double y_at(int row) const;
};

class HeatmapRenderer {
public:
    explicit HeatmapRenderer(PathLossModel model, const HeatmapConfig& cfg = {})
      : model_(model), cfg_(cfg) {}

    // Ölçüm uç değerlerinden (+ kenar payı) sınır kutusu
    Bounds area(const std::vector<MeasurementPoint>& points) const;

    HeatmapGrid render(const std::vector<InterferenceSource>& sources,
                       const std::vector<MeasurementPoint>& points,
                       int grid_size) const;

private:
    PathLossModel model_;
    HeatmapConfig cfg_;
};

// İlk satır: x koordinatları, sonraki satırlar: y, değerler...
bool write_csv(const HeatmapGrid& g, const std::string& path);

} // namespace rfloc
