#pragma once
#include "rfloc/path_loss.hpp"
#include "rfloc/source.hpp"
#include <cmath>
#include <random>
#include <utility>
#include <vector>

namespace rfloc {

struct SimEmitter {
    double x, y;       // m
    double freq_mhz;
    double tx_offset_db = 0.0;   // model RSSI'sına eklenen güç farkı
};

// Sabit tohumlu saha taraması simülasyonu: rastgele konumlar,
// yol kaybı modelinden RSSI + Gaussian gürültü
class DummySource : public ISource {
public:
    DummySource(size_t n, std::vector<SimEmitter> emitters, const PathLossConfig& pl = {},
                double extent_m = 10.0, double noise_db = 2.0, double freq_jitter_mhz = 1.0)
      : N_(n), emitters_(std::move(emitters)), model_(pl),
        pos_(0.0, extent_m), noise_(0.0, noise_db),
        jitter_(-freq_jitter_mhz, freq_jitter_mhz) {}

    bool next(Sample& out) override {
        if (N_ == 0 || emitters_.empty()) return false;
        --N_;
        const SimEmitter& e = emitters_[k_++ % emitters_.size()];
        out.x = pos_(rng_);
        out.y = pos_(rng_);
        const double d = std::hypot(out.x - e.x, out.y - e.y);
        out.rssi_dbm = model_.distance_to_rssi(d) + e.tx_offset_db + noise_(rng_);
        out.freq_mhz = e.freq_mhz + jitter_(rng_);
        return true;
    }

private:
    size_t N_;
    size_t k_ = 0;
    std::vector<SimEmitter> emitters_;
    PathLossModel model_;
    std::mt19937 rng_{12345};
    std::uniform_real_distribution<double> pos_;
    std::normal_distribution<double> noise_;
    std::uniform_real_distribution<double> jitter_;
};

} // namespace rfloc
