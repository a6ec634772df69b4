#ifndef REGCALC_CSV_READER_HPP
#define REGCALC_CSV_READER_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace regcalc {

// Line-oriented CSV reader. Supports double-quoted fields (with "" escapes),
// skips blank lines and lines starting with '#'.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Reads the header row and remembers column positions by name
    std::vector<std::string> read_header();

    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

    // Column index by header name, or -1 if absent
    int column_index(const std::string& name) const;
    bool has_column(const std::string& name) const { return column_index(name) >= 0; }

    // Cell lookup by header name; empty string when column or cell is missing
    std::string field(const std::vector<std::string>& row, const std::string& name) const;

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;
    std::map<std::string, int> columns_;

    bool next_content_line(std::string& line);
    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace regcalc

#endif // REGCALC_CSV_READER_HPP
