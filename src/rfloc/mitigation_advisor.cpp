#include "rfloc/mitigation_advisor.hpp"
#include "rfloc/channel_mapper.hpp"

#include <algorithm>
#include <cstdio>

namespace rfloc {

namespace {

std::string join_channels(const std::vector<uint32_t>& chs) {
    std::string s;
    for (size_t i = 0; i < chs.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(chs[i]);
    }
    return s.empty() ? std::string("none") : s;
}

std::vector<std::string> by_type(const InterferenceSource& src) {
    switch (src.type) {
    case InterferenceType::Microwave:
        return {"Advice: keep the WiFi router at least 3 m away from the microwave oven",
                "Optimize: use the 5 GHz band to avoid 2.4 GHz interference",
                "Adjust: avoid heavy network use while the microwave is running"};
    case InterferenceType::Bluetooth:
        return {"Optimize: enable WiFi 6 BSS coloring to reduce co-channel interference",
                "Advice: move clients to 5 GHz, Bluetooth only operates at 2.4 GHz"};
    case InterferenceType::WirelessPhone:
        return {"Advice: replace the handset with a 5.8 GHz or DECT 6.0 cordless phone",
                "Optimize: move the WiFi router away from the phone base station"};
    case InterferenceType::BabyMonitor:
        return {"Advice: move the baby monitor transmitter away from access points",
                "Optimize: prefer a monitor model operating outside 2.4 GHz (e.g. DECT)"};
    case InterferenceType::WirelessCamera:
        return {"Advice: switch the camera to wired Ethernet or a 5 GHz link",
                "Optimize: select a WiFi channel that does not overlap the camera's video carrier"};
    case InterferenceType::Zigbee:
        return {"Optimize: move the ZigBee network to channel 25 or 26, above WiFi channel 11",
                "Advice: keep ZigBee coordinators away from access points"};
    case InterferenceType::NeighboringWifi:
        return {"Optimize: avoid channels [" + join_channels(src.affected_channels) + "], pick a clean channel",
                "Advice: lower AP transmit power to reduce coverage overlap",
                "Consider: enable DFS channels to widen the usable spectrum"};
    case InterferenceType::Radar:
        return {"Advice: avoid DFS channels near the radar frequency",
                "Optimize: configure the AP to fall back to non-DFS channels automatically"};
    case InterferenceType::Other24G:
    case InterferenceType::Other5G:
    case InterferenceType::Unknown:
        break;
    }
    return {"Advice: run a spectrum scan to identify the unknown emitter",
            "Optimize: change the AP channel and re-measure"};
}

bool mentions_5ghz(const std::vector<std::string>& v) {
    return std::any_of(v.begin(), v.end(),
                       [](const std::string& s) { return s.find("5 GHz") != std::string::npos; });
}

} // namespace

std::vector<std::string> MitigationAdvisor::advise(const InterferenceSource& src) const {
    std::vector<std::string> out = by_type(src);

    // Şiddete göre
    if (src.severity == SeverityLevel::Critical) {
        out.insert(out.begin(), "URGENT: identify and remove the interference source immediately");
        out.push_back("Advice: consider RF shielding or changing the network topology");
    } else if (src.severity == SeverityLevel::High) {
        out.insert(out.begin(), "WARNING: interference impact is significant, act soon");
    }

    // Konuma göre
    if (src.location && src.location_confidence > confidence_threshold_) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "Location: source estimated at (%.1f, %.1f) m, confidence %.0f%%",
                      src.location->x, src.location->y, src.location_confidence * 100.0);
        out.emplace_back(buf);
        out.emplace_back("Action: inspect that position for the interfering device");
    }

    // Uzun vadeli
    if (in_24ghz_band(src.frequency_range.first) && !mentions_5ghz(out)) {
        out.emplace_back("Long term: migrate to 5 GHz or WiFi 6E (6 GHz)");
    }
    return out;
}

} // namespace rfloc
