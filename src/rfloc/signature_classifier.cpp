#include "rfloc/signature_classifier.hpp"
#include "rfloc/channel_mapper.hpp"

namespace rfloc {

InterferenceType SignatureClassifier::classify(double freq_avg, double rssi_avg,
                                               const std::string& pattern) const {
    const Signature* best = nullptr;
    double best_score = 0.0;

    for (const auto& sig : kSignatures) {
        const bool freq_match  = freq_avg >= sig.freq_min && freq_avg <= sig.freq_max;
        const bool power_match = rssi_avg >= sig.power_min && rssi_avg <= sig.power_max;
        if (!freq_match || !power_match) continue;

        double score = 1.0;
        if (pattern == sig.pattern) score += 0.5;

        // kesin büyük: eşitlikte tablodaki ilk aday kalır
        if (score > best_score) {
            best_score = score;
            best = &sig;
        }
    }
    if (best) return best->type;

    if (in_24ghz_band(freq_avg)) return InterferenceType::Other24G;
    if (in_5ghz_band(freq_avg))  return InterferenceType::Other5G;
    return InterferenceType::Unknown;
}

} // namespace rfloc
