#pragma once
#include "rfloc/types.hpp"
#include <string>
#include <vector>

namespace rfloc {

// Kural tabanlı giderme önerileri (tür + şiddet + konum güveni)
class MitigationAdvisor {
public:
    explicit MitigationAdvisor(double confidence_threshold = 0.6)
      : confidence_threshold_(confidence_threshold) {}

    std::vector<std::string> advise(const InterferenceSource& src) const;

private:
    double confidence_threshold_;
};

} // namespace rfloc
