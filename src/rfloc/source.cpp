#include "rfloc/source.hpp"
#include "rfloc/interference_locator.hpp"

namespace rfloc {

size_t feed(ISource& src, InterferenceLocator& loc) {
    Sample s;
    size_t n = 0;
    while (src.next(s)) {
        loc.add_measurement(s.x, s.y, s.rssi_dbm, s.freq_mhz);
        ++n;
    }
    return n;
}

} // namespace rfloc
