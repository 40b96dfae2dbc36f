#pragma once
#include <stdexcept>
#include <string>

namespace rfloc {

// Yapılandırma reddedildiğinde fırlatılır (tek "sert" hata türü)
class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

struct PathLossConfig {
    double exponent           = 2.0;    // serbest uzay=2, iç mekan 3-4
    double reference_distance = 1.0;    // metre
    double reference_rssi     = -40.0;  // dBm @ reference_distance
};

// exponent > 0 ve reference_distance > 0 olmalı, aksi halde InvalidConfig
void validate(const PathLossConfig& cfg);

struct LocatorConfig {
    PathLossConfig path_loss{};
    double cluster_bandwidth    = 20.0;  // MHz, kümeleme çözünürlüğü
    double channel_bandwidth    = 20.0;  // MHz, etkilenen kanal penceresi
    double confidence_threshold = 0.6;   // konum önerisi için alt sınır
    bool   verbose              = false;
};

struct Params {
    // Yol kaybı modeli
    double path_loss_exponent   = 2.0;
    double reference_distance   = 1.0;
    double reference_rssi       = -40.0;

    // Kümeleme / kanal
    double cluster_bandwidth    = 20.0;
    double channel_bandwidth    = 20.0;

    // Tavsiye
    double confidence_threshold = 0.6;

    // Isı haritası
    int    grid_size            = 50;

    bool   verbose              = true;
};

inline LocatorConfig to_locator_config(const Params& p) {
    LocatorConfig c;
    c.path_loss.exponent           = p.path_loss_exponent;
    c.path_loss.reference_distance = p.reference_distance;
    c.path_loss.reference_rssi     = p.reference_rssi;
    c.cluster_bandwidth            = p.cluster_bandwidth;
    c.channel_bandwidth            = p.channel_bandwidth;
    c.confidence_threshold         = p.confidence_threshold;
    c.verbose                      = p.verbose;
    return c;
}

} // namespace rfloc
