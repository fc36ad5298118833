#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace lungrisk::training {

// Header row plus data rows; cells are kept as text
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    std::optional<size_t> column(const std::string& name) const {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return i;
        }
        return std::nullopt;
    }
};

// Splits one record. Quoted fields may hold commas, and "" inside quotes is a literal quote.
inline std::vector<std::string> splitCsvLine(const std::string& line, char delim = ',') {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
            else if (c == '"') quoted = false;
            else cur += c;
        } else if (c == '"') {
            quoted = true;
        } else if (c == delim) {
            out.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

inline CsvTable readCsv(std::istream& in) {
    CsvTable t;
    std::string line;
    if (!std::getline(in, line)) return t;
    // Strip a UTF-8 byte order mark
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    t.header = splitCsvLine(line);
    for (auto& h : t.header) {
        const auto first = h.find_first_not_of(" \t");
        const auto last = h.find_last_not_of(" \t");
        h = (first == std::string::npos) ? std::string() : h.substr(first, last - first + 1);
    }
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        auto cells = splitCsvLine(line);
        cells.resize(t.header.size());
        t.rows.push_back(std::move(cells));
    }
    return t;
}

} // namespace lungrisk::training
