#include "rfloc/frequency_clusterer.hpp"
#include <algorithm>
#include <cmath>

namespace rfloc {

ClusterMap FrequencyClusterer::cluster(const std::vector<MeasurementPoint>& points) const {
    std::vector<MeasurementPoint> sorted(points);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const MeasurementPoint& a, const MeasurementPoint& b) {
                         return a.frequency < b.frequency;
                     });

    ClusterMap clusters;
    std::map<int, double> freq_sum;   // kayan ortalama için toplam
    int next_id = 0;
    const double half = bandwidth_ / 2.0;

    for (const auto& p : sorted) {
        bool found = false;
        for (auto& [id, members] : clusters) {
            const double center = freq_sum[id] / static_cast<double>(members.size());
            if (std::fabs(p.frequency - center) <= half) {
                members.push_back(p);
                freq_sum[id] += p.frequency;
                found = true;
                break;
            }
        }
        if (!found) {
            clusters[next_id] = Cluster{p};
            freq_sum[next_id] = p.frequency;
            ++next_id;
        }
    }
    return clusters;
}

} // namespace rfloc
