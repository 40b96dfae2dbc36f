#include "rfloc/types.hpp"
#include <array>

namespace rfloc {

namespace {

struct TypeName {
    InterferenceType type;
    const char*      name;
    const char*      label;
};

constexpr std::array<TypeName, 11> kTypeNames{{
    {InterferenceType::Microwave,       "MICROWAVE",        "Microwave oven"},
    {InterferenceType::Bluetooth,       "BLUETOOTH",        "Bluetooth device"},
    {InterferenceType::WirelessPhone,   "WIRELESS_PHONE",   "Cordless phone"},
    {InterferenceType::BabyMonitor,     "BABY_MONITOR",     "Baby monitor"},
    {InterferenceType::WirelessCamera,  "WIRELESS_CAMERA",  "Wireless camera"},
    {InterferenceType::Zigbee,          "ZIGBEE",           "ZigBee device"},
    {InterferenceType::NeighboringWifi, "NEIGHBORING_WIFI", "Neighboring WiFi"},
    {InterferenceType::Radar,           "RADAR",            "Radar signal"},
    {InterferenceType::Other24G,        "OTHER_24G",        "Other 2.4 GHz device"},
    {InterferenceType::Other5G,         "OTHER_5G",         "Other 5 GHz device"},
    {InterferenceType::Unknown,         "UNKNOWN",          "Unknown source"},
}};

struct SeverityName {
    SeverityLevel level;
    const char*   name;
    int           score;
};

constexpr std::array<SeverityName, 5> kSeverityNames{{
    {SeverityLevel::Negligible, "NEGLIGIBLE", 10},
    {SeverityLevel::Low,        "LOW",        30},
    {SeverityLevel::Medium,     "MEDIUM",     50},
    {SeverityLevel::High,       "HIGH",       70},
    {SeverityLevel::Critical,   "CRITICAL",   90},
}};

} // namespace

const char* to_string(InterferenceType t) {
    for (const auto& e : kTypeNames) if (e.type == t) return e.name;
    return "UNKNOWN";
}

const char* label(InterferenceType t) {
    for (const auto& e : kTypeNames) if (e.type == t) return e.label;
    return "Unknown source";
}

const char* to_string(SeverityLevel s) {
    for (const auto& e : kSeverityNames) if (e.level == s) return e.name;
    return "NEGLIGIBLE";
}

int severity_score(SeverityLevel s) {
    for (const auto& e : kSeverityNames) if (e.level == s) return e.score;
    return 0;
}

std::optional<InterferenceType> parse_interference_type(const std::string& s) {
    for (const auto& e : kTypeNames) if (s == e.name) return e.type;
    return std::nullopt;
}

std::optional<SeverityLevel> parse_severity(const std::string& s) {
    for (const auto& e : kSeverityNames) if (s == e.name) return e.level;
    return std::nullopt;
}

} // namespace rfloc
