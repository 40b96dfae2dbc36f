#pragma once
#include "rfloc/types.hpp"
#include <map>
#include <vector>

namespace rfloc {

using Cluster    = std::vector<MeasurementPoint>;
using ClusterMap = std::map<int, Cluster>;   // id: oluşturulma sırası (0,1,2...)

// Frekans yakınlığına göre gruplama.
// Noktalar artan frekansa göre kararlı sıralanır (eşit frekanslarda ekleme
// sırası korunur); her nokta, ortalama frekansı bandwidth/2 içinde kalan ilk
// kümeye katılır, yoksa yeni küme açar.
class FrequencyClusterer {
public:
    explicit FrequencyClusterer(double bandwidth_mhz = 20.0) : bandwidth_(bandwidth_mhz) {}

    ClusterMap cluster(const std::vector<MeasurementPoint>& points) const;

    double bandwidth() const { return bandwidth_; }

private:
    double bandwidth_;
};

} // namespace rfloc
