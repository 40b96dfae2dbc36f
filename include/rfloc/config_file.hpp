#pragma once
#include "rfloc/config.hpp"
#include <string>

namespace rfloc {

// YAML/JSON/XML ayar dosyası (cv::FileStorage). Eksik anahtarlar varsayılanı korur.
// false: dosya açılamadı/okunamadı
bool load_params(const std::string& path, Params& p);

} // namespace rfloc
