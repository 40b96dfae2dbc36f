#include "rfloc/config_file.hpp"
#include <opencv2/core.hpp>
#include <cstdio>

namespace rfloc {

namespace {

void read_double(const cv::FileNode& root, const char* key, double& dst) {
    const cv::FileNode n = root[key];
    if (n.isReal() || n.isInt()) dst = static_cast<double>(n);
}

void read_int(const cv::FileNode& root, const char* key, int& dst) {
    const cv::FileNode n = root[key];
    if (n.isInt()) dst = static_cast<int>(n);
}

} // namespace

bool load_params(const std::string& path, Params& p) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            std::fprintf(stderr, "[CFG] cannot open %s\n", path.c_str());
            return false;
        }
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[CFG] parse error in %s: %s\n", path.c_str(), e.what());
        return false;
    }

    const cv::FileNode root = fs.root();
    read_double(root, "path_loss_exponent",   p.path_loss_exponent);
    read_double(root, "reference_distance",   p.reference_distance);
    read_double(root, "reference_rssi",       p.reference_rssi);
    read_double(root, "cluster_bandwidth",    p.cluster_bandwidth);
    read_double(root, "channel_bandwidth",    p.channel_bandwidth);
    read_double(root, "confidence_threshold", p.confidence_threshold);
    read_int   (root, "grid_size",            p.grid_size);

    int verbose = p.verbose ? 1 : 0;
    read_int(root, "verbose", verbose);
    p.verbose = verbose != 0;

    if (p.verbose)
        std::printf("[CFG] Loaded %s: n=%.2f d0=%.2f rssi0=%.1f bw=%.1f grid=%d\n",
                    path.c_str(), p.path_loss_exponent, p.reference_distance,
                    p.reference_rssi, p.cluster_bandwidth, p.grid_size);
    return true;
}

} // namespace rfloc
