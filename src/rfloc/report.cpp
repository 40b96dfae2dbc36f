#include "rfloc/report.hpp"
#include "rfloc/utils.hpp"

#include <cstdio>
#include <fstream>

namespace rfloc {

using nlohmann::json;

json source_to_json(const InterferenceSource& s) {
    json j;
    j["id"]                  = s.source_id;
    j["type"]                = to_string(s.type);
    j["severity"]            = to_string(s.severity);
    j["severity_score"]      = s.severity_score();
    j["location"]            = s.location ? json::array({s.location->x, s.location->y}) : json(nullptr);
    j["location_confidence"] = s.location_confidence;
    j["frequency_range"]     = json::array({s.frequency_range.first, s.frequency_range.second});
    j["avg_power"]           = s.avg_power;
    j["affected_channels"]   = s.affected_channels;
    j["mitigation_strategies"] = s.mitigation_strategies;
    return j;
}

json export_report(const InterferenceLocator& loc) {
    json doc;
    doc["timestamp"]         = iso8601(sys_clock::now());
    doc["measurement_count"] = loc.measurements().size();

    json arr = json::array();
    for (const auto& s : loc.sources()) arr.push_back(source_to_json(s));
    doc["interference_sources"] = std::move(arr);

    const PathLossConfig& pl = loc.path_loss();
    doc["settings"] = {
        {"path_loss_exponent", pl.exponent},
        {"reference_distance", pl.reference_distance},
        {"reference_rssi",     pl.reference_rssi}
    };
    return doc;
}

InterferenceSource source_from_json(const json& j) {
    try {
        InterferenceSource s;
        s.source_id = j.at("id").get<std::string>();

        const auto type = parse_interference_type(j.at("type").get<std::string>());
        if (!type) throw ReportError("unknown interference type: " + j.at("type").get<std::string>());
        s.type = *type;

        const auto sev = parse_severity(j.at("severity").get<std::string>());
        if (!sev) throw ReportError("unknown severity: " + j.at("severity").get<std::string>());
        s.severity = *sev;

        const json& loc = j.at("location");
        if (!loc.is_null()) {
            if (!loc.is_array() || loc.size() != 2) throw ReportError("location must be [x, y] or null");
            s.location = Point2{loc[0].get<double>(), loc[1].get<double>()};
        }
        s.location_confidence = j.at("location_confidence").get<double>();

        const json& fr = j.at("frequency_range");
        if (!fr.is_array() || fr.size() != 2) throw ReportError("frequency_range must be [min, max]");
        s.frequency_range = {fr[0].get<double>(), fr[1].get<double>()};

        s.avg_power             = j.at("avg_power").get<double>();
        s.affected_channels     = j.at("affected_channels").get<std::vector<uint32_t>>();
        s.mitigation_strategies = j.at("mitigation_strategies").get<std::vector<std::string>>();
        return s;
    } catch (const json::exception& e) {
        throw ReportError(std::string("malformed interference source: ") + e.what());
    }
}

ReportDocument import_report(const json& doc) {
    try {
        ReportDocument r;
        r.timestamp         = doc.at("timestamp").get<std::string>();
        r.measurement_count = doc.at("measurement_count").get<size_t>();
        for (const auto& js : doc.at("interference_sources")) r.sources.push_back(source_from_json(js));

        const json& st = doc.at("settings");
        r.settings.exponent           = st.at("path_loss_exponent").get<double>();
        r.settings.reference_distance = st.at("reference_distance").get<double>();
        r.settings.reference_rssi     = st.at("reference_rssi").get<double>();
        return r;
    } catch (const json::exception& e) {
        throw ReportError(std::string("malformed report: ") + e.what());
    }
}

bool write_report(const InterferenceLocator& loc, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        std::fprintf(stderr, "[ERR] cannot open %s for writing\n", path.c_str());
        return false;
    }
    out << export_report(loc).dump(2) << '\n';
    return static_cast<bool>(out);
}

} // namespace rfloc
