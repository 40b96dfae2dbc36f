#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfloc {

using sys_clock = std::chrono::system_clock;

struct MeasurementPoint {
    double x         = 0.0;   // metre, yerel koordinat
    double y         = 0.0;
    double rssi      = 0.0;   // dBm
    double frequency = 0.0;   // MHz
    sys_clock::time_point timestamp{};
};

struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

enum class InterferenceType {
    Microwave,
    Bluetooth,
    WirelessPhone,
    BabyMonitor,
    WirelessCamera,
    Zigbee,
    NeighboringWifi,
    Radar,
    Other24G,
    Other5G,
    Unknown
};

// Sıralı: NEGLIGIBLE < ... < CRITICAL
enum class SeverityLevel { Negligible = 0, Low, Medium, High, Critical };

// Dışa aktarımda kullanılan adlar ("MICROWAVE", "CRITICAL", ...)
const char* to_string(InterferenceType t);
const char* to_string(SeverityLevel s);
std::optional<InterferenceType> parse_interference_type(const std::string& s);
std::optional<SeverityLevel>    parse_severity(const std::string& s);

// Ekranda gösterim için
const char* label(InterferenceType t);

// CRITICAL 90, HIGH 70, MEDIUM 50, LOW 30, NEGLIGIBLE 10
int severity_score(SeverityLevel s);

struct InterferenceSource {
    std::string                 source_id;
    InterferenceType            type     = InterferenceType::Unknown;
    SeverityLevel               severity = SeverityLevel::Negligible;
    std::optional<Point2>       location;
    double                      location_confidence = 0.0;
    std::pair<double, double>   frequency_range{0.0, 0.0};
    double                      avg_power = 0.0;
    uint32_t                    detection_count = 0;
    sys_clock::time_point           first_detected{};
    sys_clock::time_point           last_detected{};
    std::vector<uint32_t>       affected_channels;
    std::vector<std::string>    mitigation_strategies;

    int severity_score() const { return rfloc::severity_score(severity); }
};

} // namespace rfloc
