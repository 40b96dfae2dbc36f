#include "rfloc/report.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using nlohmann::json;
using rfloc::InterferenceLocator;
using rfloc::ReportError;

namespace {

InterferenceLocator surveyed() {
    InterferenceLocator loc;
    loc.add_measurement(0, 0, -45, 2437);
    loc.add_measurement(5, 0, -55, 2437);
    loc.add_measurement(2.5, 4, -50, 2437);
    loc.add_measurement(10, 0, -75, 2450);
    loc.add_measurement(10, 5, -70, 2450);
    loc.detect_interference_sources();
    return loc;
}

} // namespace

TEST(Report, ExportShape) {
    const auto loc = surveyed();
    const json doc = rfloc::export_report(loc);

    ASSERT_TRUE(doc.at("timestamp").is_string());
    const std::string ts = doc["timestamp"].get<std::string>();
    EXPECT_GE(ts.size(), 19u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(doc.at("measurement_count"), 5);

    const json& arr = doc.at("interference_sources");
    ASSERT_EQ(arr.size(), 2u);
    const json& s0 = arr[0];
    for (const char* key : {"id", "type", "severity", "severity_score", "location",
                            "location_confidence", "frequency_range", "avg_power",
                            "affected_channels", "mitigation_strategies"}) {
        EXPECT_TRUE(s0.contains(key)) << key;
    }
    EXPECT_EQ(s0["type"], "BLUETOOTH");
    EXPECT_EQ(s0["severity"], "CRITICAL");
    EXPECT_EQ(s0["severity_score"], 90);
    ASSERT_TRUE(s0["location"].is_array());
    EXPECT_EQ(s0["location"].size(), 2u);
    EXPECT_TRUE(arr[1]["location"].is_null());
    EXPECT_EQ(arr[1]["severity_score"], 70);

    const json& st = doc.at("settings");
    EXPECT_EQ(st.at("path_loss_exponent"), 2.0);
    EXPECT_EQ(st.at("reference_distance"), 1.0);
    EXPECT_EQ(st.at("reference_rssi"), -40.0);
}

TEST(Report, ImportRoundTrip) {
    const auto loc = surveyed();
    const json parsed = json::parse(rfloc::export_report(loc).dump());
    const rfloc::ReportDocument r = rfloc::import_report(parsed);

    EXPECT_EQ(r.measurement_count, 5u);
    EXPECT_EQ(r.settings.exponent, 2.0);
    ASSERT_EQ(r.sources.size(), loc.sources().size());
    for (size_t i = 0; i < r.sources.size(); ++i) {
        const auto& a = loc.sources()[i];
        const auto& b = r.sources[i];
        EXPECT_EQ(a.source_id, b.source_id);
        EXPECT_EQ(a.type, b.type);
        EXPECT_EQ(a.severity, b.severity);
        EXPECT_EQ(a.location.has_value(), b.location.has_value());
        if (a.location) {
            EXPECT_DOUBLE_EQ(a.location->x, b.location->x);
            EXPECT_DOUBLE_EQ(a.location->y, b.location->y);
        }
        EXPECT_DOUBLE_EQ(a.location_confidence, b.location_confidence);
        EXPECT_DOUBLE_EQ(a.frequency_range.first, b.frequency_range.first);
        EXPECT_DOUBLE_EQ(a.frequency_range.second, b.frequency_range.second);
        EXPECT_DOUBLE_EQ(a.avg_power, b.avg_power);
        EXPECT_EQ(a.affected_channels, b.affected_channels);
        EXPECT_EQ(a.mitigation_strategies.size(), b.mitigation_strategies.size());
    }
}

TEST(Report, EmptyLocatorExportsEmptyList) {
    InterferenceLocator loc;
    const json doc = rfloc::export_report(loc);
    EXPECT_EQ(doc["measurement_count"], 0);
    EXPECT_TRUE(doc["interference_sources"].is_array());
    EXPECT_TRUE(doc["interference_sources"].empty());
}

TEST(Report, MalformedDocumentsAreRejected) {
    const json good = rfloc::export_report(surveyed());

    json missing = good;
    missing.erase("settings");
    EXPECT_THROW(rfloc::import_report(missing), ReportError);

    json bad_type = good;
    bad_type["interference_sources"][0]["type"] = "TOASTER";
    EXPECT_THROW(rfloc::import_report(bad_type), ReportError);

    json bad_loc = good;
    bad_loc["interference_sources"][0]["location"] = json::array({1.0, 2.0, 3.0});
    EXPECT_THROW(rfloc::import_report(bad_loc), ReportError);

    json bad_value = good;
    bad_value["interference_sources"][0]["avg_power"] = "loud";
    EXPECT_THROW(rfloc::import_report(bad_value), ReportError);
}

TEST(Report, WritesFile) {
    const auto loc = surveyed();
    const std::string path = ::testing::TempDir() + "rfloc_report.json";
    ASSERT_TRUE(rfloc::write_report(loc, path));

    std::ifstream in(path);
    const json doc = json::parse(in);
    EXPECT_EQ(doc["interference_sources"].size(), 2u);
    std::remove(path.c_str());
}
