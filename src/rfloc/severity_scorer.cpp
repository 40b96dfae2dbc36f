#include "rfloc/severity_scorer.hpp"
#include "rfloc/channel_mapper.hpp"
#include <algorithm>

namespace rfloc {

int SeverityScorer::power_score(double rssi_avg) {
    if (rssi_avg >= -40.0) return 40;
    if (rssi_avg >= -50.0) return 30;
    if (rssi_avg >= -60.0) return 20;
    if (rssi_avg >= -70.0) return 10;
    return 5;
}

int SeverityScorer::channel_score(size_t n_channels) {
    return static_cast<int>(std::min<size_t>(40, 10 * n_channels));
}

int SeverityScorer::band_score(double freq_avg) {
    if (in_24ghz_band(freq_avg)) return 20;  // 2.4 GHz kalabalık
    if (in_5ghz_band(freq_avg))  return 10;
    return 5;
}

int SeverityScorer::score(double rssi_avg, double freq_avg,
                          const std::vector<uint32_t>& channels) const {
    const int total = power_score(rssi_avg) + channel_score(channels.size()) + band_score(freq_avg);
    return std::min(100, total);
}

SeverityLevel SeverityScorer::level(double rssi_avg, double freq_avg,
                                    const std::vector<uint32_t>& channels) const {
    return level_for(score(rssi_avg, freq_avg, channels));
}

SeverityLevel SeverityScorer::level_for(int total) {
    if (total >= 80) return SeverityLevel::Critical;
    if (total >= 60) return SeverityLevel::High;
    if (total >= 40) return SeverityLevel::Medium;
    if (total >= 20) return SeverityLevel::Low;
    return SeverityLevel::Negligible;
}

} // namespace rfloc
