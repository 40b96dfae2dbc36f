#pragma once
#include <cstddef>

namespace rfloc {

class InterferenceLocator;

struct Sample {
    double x = 0.0, y = 0.0;   // m
    double rssi_dbm = 0.0;
    double freq_mhz = 0.0;
};

// Ölçüm sağlayıcı arayüzü (dosya/simülasyon/tarayıcı hepsi buradan türesin)
class ISource {
public:
    virtual ~ISource() = default;
    // true: örnek üretildi; false: kaynak bitti/hata
    virtual bool next(Sample& out) = 0;
};

// Kaynak bitene kadar okur, eklenen örnek sayısını döndürür
size_t feed(ISource& src, InterferenceLocator& loc);

} // namespace rfloc
