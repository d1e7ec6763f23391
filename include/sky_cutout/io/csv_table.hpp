#pragma once

#include "sky_cutout/core/types.hpp"
#include <string>
#include <vector>

namespace sky_cutout::io {

// Comma-separated text with a header line. Fields may be double-quoted
// ("" escapes a quote). Blank lines and lines starting with '#' are skipped.
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> line_numbers;   // 1-based source line of each row
};

CsvTable read_csv(const fs::path& path);
CsvTable parse_csv(const std::string& text, const std::string& source_name);

std::vector<std::string> split_csv_line(const std::string& line);

} // namespace sky_cutout::io
