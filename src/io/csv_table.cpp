#include "sky_cutout/io/csv_table.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <sstream>

namespace sky_cutout::io {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(core::trim(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(core::trim(field));
    return fields;
}

CsvTable parse_csv(const std::string& text, const std::string& source_name) {
    CsvTable table;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    bool have_header = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line_no == 1 && line.size() >= 3 &&
            static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.erase(0, 3);
        }

        std::string stripped = core::trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        auto fields = split_csv_line(line);
        if (!have_header) {
            table.header = std::move(fields);
            have_header = true;
            continue;
        }

        if (fields.size() != table.header.size()) {
            throw ValidationError(source_name + " line " + std::to_string(line_no) +
                                  ": expected " + std::to_string(table.header.size()) +
                                  " fields, got " + std::to_string(fields.size()));
        }
        table.rows.push_back(std::move(fields));
        table.line_numbers.push_back(line_no);
    }

    if (!have_header) {
        throw ValidationError(source_name + " has no header line");
    }
    return table;
}

CsvTable read_csv(const fs::path& path) {
    return parse_csv(core::read_text(path), path.string());
}

} // namespace sky_cutout::io
