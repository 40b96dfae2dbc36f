#include "rfloc/csv_source.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rfloc {

CsvSource::CsvSource(const std::string& path, bool verbose)
    : file_(std::make_unique<std::ifstream>(path)), verbose_(verbose) {
    if (*file_) {
        in_ = file_.get();
    } else {
        std::fprintf(stderr, "[CSV] cannot open %s\n", path.c_str());
    }
}

CsvSource::CsvSource(std::istream& in, bool verbose) : in_(&in), verbose_(verbose) {}

bool CsvSource::parse_line(const std::string& line, Sample& out) {
    double v[4];
    const char* p = line.c_str();
    for (int i = 0; i < 4; ++i) {
        char* end = nullptr;
        v[i] = std::strtod(p, &end);
        if (end == p || !std::isfinite(v[i])) return false;
        while (*end == ' ' || *end == '\t') ++end;
        if (i < 3) {
            if (*end != ',' && *end != ';') return false;
            ++end;
        }
        p = end;
    }
    while (*p && std::isspace(static_cast<unsigned char>(*p))) ++p;
    if (*p != '\0') return false;

    out.x = v[0];
    out.y = v[1];
    out.rssi_dbm = v[2];
    out.freq_mhz = v[3];
    return true;
}

bool CsvSource::next(Sample& out) {
    if (!in_) return false;
    std::string line;
    while (std::getline(*in_, line)) {
        ++line_no_;
        size_t b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') continue;
        const size_t e = line.find_last_not_of(" \t\r");
        line = line.substr(b, e - b + 1);

        if (parse_line(line, out)) {
            header_checked_ = true;
            return true;
        }
        if (!header_checked_ && !std::isdigit(static_cast<unsigned char>(line[0]))
            && line[0] != '-' && line[0] != '+' && line[0] != '.') {
            header_checked_ = true;  // başlık satırı
            continue;
        }
        header_checked_ = true;
        ++skipped_;
        if (verbose_)
            std::fprintf(stderr, "[CSV] line %zu malformed, skipped: %s\n", line_no_, line.c_str());
    }
    return false;
}

} // namespace rfloc
