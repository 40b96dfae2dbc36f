#pragma once
#include <array>
#include <cstdint>
#include <vector>

namespace rfloc {

inline bool in_24ghz_band(double mhz) { return mhz >= 2400.0 && mhz <= 2500.0; }
inline bool in_5ghz_band(double mhz)  { return mhz >= 5000.0 && mhz <= 6000.0; }

inline constexpr std::array<uint32_t, 25> k5GhzChannels{
    36, 40, 44, 48, 52, 56, 60, 64,
    100, 104, 108, 112, 116, 120, 124, 128, 132, 136, 140, 144,
    149, 153, 157, 161, 165
};

// 1..13 -> 2412 + 5(ch-1), 5 GHz kanalları -> 5000 + 5ch
double channel_center_mhz(uint32_t channel);

class ChannelImpactMapper {
public:
    explicit ChannelImpactMapper(double bandwidth_mhz = 20.0) : bandwidth_(bandwidth_mhz) {}

    // Merkez frekansı freq_avg'ye bandwidth mesafesinde olan kanallar (artan sırada)
    std::vector<uint32_t> affected_channels(double freq_avg) const;

private:
    double bandwidth_;
};

} // namespace rfloc
