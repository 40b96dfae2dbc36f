#pragma once
#include "rfloc/source.hpp"
#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace rfloc {

// "x,y,rssi,freq" satırları. '#' yorumları ve boş satırlar atlanır,
// sayısal olmayan ilk satır başlık kabul edilir, bozuk satırlar loglanıp atlanır.
class CsvSource : public ISource {
public:
    explicit CsvSource(const std::string& path, bool verbose = true);
    explicit CsvSource(std::istream& in, bool verbose = true);

    bool ok() const { return in_ != nullptr; }
    bool next(Sample& out) override;

    size_t skipped() const { return skipped_; }

private:
    static bool parse_line(const std::string& line, Sample& out);

    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;
    bool   verbose_;
    size_t line_no_ = 0;
    size_t skipped_ = 0;
    bool   header_checked_ = false;
};

} // namespace rfloc
