#pragma once
#include "rfloc/types.hpp"
#include <cstdint>
#include <vector>

namespace rfloc {

// Toplamsal model (en fazla 100):
//   güç 0-40, etkilenen kanal 0-40, bant önemi 0-20
class SeverityScorer {
public:
    static int power_score(double rssi_avg);
    static int channel_score(size_t n_channels);
    static int band_score(double freq_avg);

    int score(double rssi_avg, double freq_avg, const std::vector<uint32_t>& channels) const;
    SeverityLevel level(double rssi_avg, double freq_avg, const std::vector<uint32_t>& channels) const;

    // >=80 CRITICAL, >=60 HIGH, >=40 MEDIUM, >=20 LOW
    static SeverityLevel level_for(int total);
};

} // namespace rfloc
