#pragma once
#include "rfloc/types.hpp"
#include <array>
#include <string>

namespace rfloc {

struct Signature {
    InterferenceType type;
    double      freq_min, freq_max;     // MHz (dahil)
    double      power_min, power_max;   // dBm (dahil)
    const char* pattern;                // "pulsed" | "hopping" | "continuous"
};

// Bilinen cihaz imzaları. Sıra sabittir: eşit skorda önce gelen kazanır.
inline constexpr std::array<Signature, 6> kSignatures{{
    {InterferenceType::Microwave,      2400.0, 2500.0, -40.0, -20.0, "pulsed"},
    {InterferenceType::Bluetooth,      2402.0, 2480.0, -70.0, -40.0, "hopping"},
    {InterferenceType::WirelessPhone,  2400.0, 2483.5, -50.0, -30.0, "continuous"},
    {InterferenceType::BabyMonitor,    2400.0, 2483.5, -60.0, -30.0, "continuous"},
    {InterferenceType::WirelessCamera, 2400.0, 2500.0, -50.0, -20.0, "continuous"},
    {InterferenceType::Zigbee,         2405.0, 2480.0, -80.0, -50.0, "hopping"},
}};

class SignatureClassifier {
public:
    // Eşleşme yoksa banda göre OTHER_24G / OTHER_5G / UNKNOWN
    InterferenceType classify(double freq_avg, double rssi_avg,
                              const std::string& pattern = "unknown") const;

    static const std::array<Signature, 6>& signatures() { return kSignatures; }
};

} // namespace rfloc
