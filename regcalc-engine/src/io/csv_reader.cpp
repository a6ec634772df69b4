#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>

namespace regcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_header() {
    auto header = read_row();
    columns_.clear();
    for (size_t i = 0; i < header.size(); ++i) {
        columns_[header[i]] = static_cast<int>(i);
    }
    return header;
}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    if (!next_content_line(line)) {
        return {};
    }
    return split(line);
}

bool CsvReader::has_more() {
    while (is_.good()) {
        int c = is_.peek();
        if (c == EOF) {
            return false;
        }
        if (c == '\n' || c == '\r') {
            is_.get();
            if (c == '\n') {
                ++line_number_;
            }
            continue;
        }
        return true;
    }
    return false;
}

int CsvReader::column_index(const std::string& name) const {
    auto it = columns_.find(name);
    return it == columns_.end() ? -1 : it->second;
}

std::string CsvReader::field(const std::vector<std::string>& row, const std::string& name) const {
    int idx = column_index(name);
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) {
        return std::string();
    }
    return row[static_cast<size_t>(idx)];
}

bool CsvReader::next_content_line(std::string& line) {
    while (std::getline(is_, line)) {
        ++line_number_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        return true;
    }
    return false;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            was_quoted = true;
        } else if (c == delimiter_) {
            row.push_back(was_quoted ? cell : trim(cell));
            cell.clear();
            was_quoted = false;
        } else {
            cell += c;
        }
    }
    if (in_quotes) {
        throw ValidationError("csv", "unterminated quote on line " + std::to_string(line_number_));
    }
    row.push_back(was_quoted ? cell : trim(cell));
    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace regcalc
