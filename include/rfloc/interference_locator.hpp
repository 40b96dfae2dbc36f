#pragma once
#include "rfloc/config.hpp"
#include "rfloc/frequency_clusterer.hpp"
#include "rfloc/heatmap.hpp"
#include "rfloc/measurement_store.hpp"
#include "rfloc/path_loss.hpp"
#include "rfloc/types.hpp"
#include <vector>

namespace rfloc {

// Bir ölçüm oturumu: kendi deposu ve yol kaybı ayarları vardır, global durum yok.
// Her tespit çağrısı sonuçları depodan sıfırdan hesaplar; önceki liste atılır.
class InterferenceLocator {
public:
    // Geçersiz yol kaybı ayarında InvalidConfig fırlatır
    explicit InterferenceLocator(const LocatorConfig& cfg = {});

    MeasurementPoint add_measurement(double x, double y, double rssi, double frequency);
    // Ölçümlerle birlikte son tespitin sonucunu da siler
    void clear_measurements();

    // Doğrular, sonra uygular (hata durumunda eski ayar korunur)
    void set_path_loss(const PathLossConfig& cfg);
    const PathLossConfig& path_loss() const { return model_.config(); }
    const PathLossModel&  model() const { return model_; }
    const LocatorConfig&  config() const { return cfg_; }

    const MeasurementStore& measurements() const { return store_; }

    // <3 ölçüm -> boş liste
    std::vector<InterferenceSource> detect_interference_sources();

    // Son tespitin sonucu
    const std::vector<InterferenceSource>& sources() const { return sources_; }

    HeatmapGrid heatmap(int grid_size = 50) const;

private:
    InterferenceSource analyze(int cluster_id, const Cluster& points,
                               const std::string& stamp) const;

    LocatorConfig    cfg_;
    PathLossModel    model_;
    MeasurementStore store_;
    std::vector<InterferenceSource> sources_;
};

} // namespace rfloc
