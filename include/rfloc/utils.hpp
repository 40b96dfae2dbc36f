#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace rfloc {

struct TicToc {
    using clock = std::chrono::steady_clock;
    clock::time_point t0;
    void tic() { t0 = clock::now(); }
    double toc_ms() const {
        using namespace std::chrono;
        return duration_cast<duration<double, std::milli>>(clock::now() - t0).count();
    }
};

// strftime biçimi, yerel saat
inline std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

// ISO 8601, yerel saat, mikrosaniye hassasiyetinde (2024-05-01T13:45:10.123456)
inline std::string iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(us < 0 ? us + 1000000 : us));
    return format_local(tp, "%Y-%m-%dT%H:%M:%S") + frac;
}

} // namespace rfloc
