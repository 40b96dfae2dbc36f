#include "rfloc/interference_locator.hpp"
#include "rfloc/channel_mapper.hpp"
#include "rfloc/mitigation_advisor.hpp"
#include "rfloc/severity_scorer.hpp"
#include "rfloc/signature_classifier.hpp"
#include "rfloc/trilaterator.hpp"
#include "rfloc/utils.hpp"

#include <algorithm>
#include <cstdio>

namespace rfloc {

InterferenceLocator::InterferenceLocator(const LocatorConfig& cfg)
    : cfg_(cfg), model_(cfg.path_loss) {}

MeasurementPoint InterferenceLocator::add_measurement(double x, double y, double rssi, double frequency) {
    return store_.add(x, y, rssi, frequency);
}

void InterferenceLocator::clear_measurements() {
    store_.clear();
    sources_.clear();
}

void InterferenceLocator::set_path_loss(const PathLossConfig& cfg) {
    model_ = PathLossModel(cfg);   // önce doğrulanır
    cfg_.path_loss = cfg;
    if (cfg_.verbose)
        std::printf("[LOC] Path loss: n=%.2f  d0=%.2f m  rssi0=%.1f dBm\n",
                    cfg.exponent, cfg.reference_distance, cfg.reference_rssi);
}

std::vector<InterferenceSource> InterferenceLocator::detect_interference_sources() {
    sources_.clear();

    if (store_.size() < 3) {
        if (cfg_.verbose)
            std::printf("[LOC] Insufficient data (points=%zu). Skipped.\n", store_.size());
        return sources_;
    }

    TicToc t;
    t.tic();

    const ClusterMap clusters = FrequencyClusterer(cfg_.cluster_bandwidth).cluster(store_.points());
    const std::string stamp = format_local(sys_clock::now(), "%H%M%S");

    if (cfg_.verbose)
        std::printf("[LOC] %zu points -> %zu frequency clusters\n", store_.size(), clusters.size());

    for (const auto& [id, points] : clusters) {
        sources_.push_back(analyze(id, points, stamp));
    }

    if (cfg_.verbose)
        std::printf("[LOC] Detection finished: %zu sources in %.3f ms\n", sources_.size(), t.toc_ms());

    return sources_;
}

InterferenceSource InterferenceLocator::analyze(int cluster_id, const Cluster& points,
                                                const std::string& stamp) const {
    InterferenceSource s;

    double f_sum = 0.0, p_sum = 0.0;
    double f_min = points.front().frequency, f_max = points.front().frequency;
    s.first_detected = points.front().timestamp;
    s.last_detected  = points.front().timestamp;
    for (const auto& p : points) {
        f_sum += p.frequency;
        p_sum += p.rssi;
        f_min = std::min(f_min, p.frequency);
        f_max = std::max(f_max, p.frequency);
        s.first_detected = std::min(s.first_detected, p.timestamp);
        s.last_detected  = std::max(s.last_detected, p.timestamp);
    }
    const double n = static_cast<double>(points.size());
    const double avg_freq = f_sum / n;
    const double avg_rssi = p_sum / n;

    char id[48];
    std::snprintf(id, sizeof(id), "INT_%d_%s", cluster_id, stamp.c_str());
    s.source_id        = id;
    s.frequency_range  = {f_min, f_max};
    s.avg_power        = avg_rssi;
    s.detection_count  = static_cast<uint32_t>(points.size());

    s.type              = SignatureClassifier().classify(avg_freq, avg_rssi);
    s.affected_channels = ChannelImpactMapper(cfg_.channel_bandwidth).affected_channels(avg_freq);
    s.severity          = SeverityScorer().level(avg_rssi, avg_freq, s.affected_channels);

    // <3 nokta veya eşdoğrusal: konum yok, güven 0
    const auto fix = Trilaterator(model_).triangulate(points);
    if (fix) {
        s.location = Point2{fix->x, fix->y};
        s.location_confidence = fix->confidence;
    }

    s.mitigation_strategies = MitigationAdvisor(cfg_.confidence_threshold).advise(s);

    if (cfg_.verbose) {
        if (fix)
            std::printf("[LOC] Cluster %d: %.1f MHz  %.1f dBm  n=%u  %s/%s  at (%.2f, %.2f) conf=%.2f\n",
                        cluster_id, avg_freq, avg_rssi, s.detection_count,
                        to_string(s.type), to_string(s.severity), fix->x, fix->y, fix->confidence);
        else
            std::printf("[LOC] Cluster %d: %.1f MHz  %.1f dBm  n=%u  %s/%s  location unavailable\n",
                        cluster_id, avg_freq, avg_rssi, s.detection_count,
                        to_string(s.type), to_string(s.severity));
    }
    return s;
}

HeatmapGrid InterferenceLocator::heatmap(int grid_size) const {
    return HeatmapRenderer(model_).render(sources_, store_.points(), grid_size);
}

} // namespace rfloc
