#ifndef OPTIMACH_IO_CSV_READER_HPP
#define OPTIMACH_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace optimach {
namespace io {

// Line-oriented CSV reader for schedule files.
// Blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-empty row with trimmed cells; empty at end of input
    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based line number of the last row returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

// Parse a numeric cell, throwing ConfigParseError naming the line on failure
double parse_number(const std::string& cell, size_t line_number);

} // namespace io
} // namespace optimach

#endif // OPTIMACH_IO_CSV_READER_HPP
