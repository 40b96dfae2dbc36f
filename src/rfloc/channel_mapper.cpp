#include "rfloc/channel_mapper.hpp"
#include <cmath>

namespace rfloc {

double channel_center_mhz(uint32_t channel) {
    if (channel >= 1 && channel <= 13) return 2412.0 + 5.0 * (channel - 1);
    return 5000.0 + 5.0 * channel;
}

std::vector<uint32_t> ChannelImpactMapper::affected_channels(double freq_avg) const {
    std::vector<uint32_t> out;
    if (in_24ghz_band(freq_avg)) {
        for (uint32_t ch = 1; ch <= 13; ++ch) {
            if (std::fabs(freq_avg - channel_center_mhz(ch)) <= bandwidth_) out.push_back(ch);
        }
    } else if (in_5ghz_band(freq_avg)) {
        for (uint32_t ch : k5GhzChannels) {
            if (std::fabs(freq_avg - channel_center_mhz(ch)) <= bandwidth_) out.push_back(ch);
        }
    }
    return out;
}

} // namespace rfloc
