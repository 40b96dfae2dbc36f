#pragma once
#include "rfloc/config.hpp"
#include "rfloc/interference_locator.hpp"
#include "rfloc/types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace rfloc {

class ReportError : public std::runtime_error {
public:
    explicit ReportError(const std::string& what) : std::runtime_error(what) {}
};

struct ReportDocument {
    std::string                     timestamp;          // ISO 8601
    size_t                          measurement_count = 0;
    std::vector<InterferenceSource> sources;
    PathLossConfig                  settings{};
};

nlohmann::json source_to_json(const InterferenceSource& s);
nlohmann::json export_report(const InterferenceLocator& loc);

// Geçersiz belge -> ReportError
InterferenceSource source_from_json(const nlohmann::json& j);
ReportDocument     import_report(const nlohmann::json& doc);

bool write_report(const InterferenceLocator& loc, const std::string& path);

} // namespace rfloc
