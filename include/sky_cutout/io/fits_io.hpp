#pragma once

#include "sky_cutout/core/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sky_cutout::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;  // int values included
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

struct FitsImageInfo {
    int width = 0;
    int height = 0;
    FitsHeader header;
};

bool is_fits_path(const fs::path& path);

// Header and dimensions of the first image HDU
FitsImageInfo read_fits_image_info(const fs::path& path);

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Reads rows [y0, y0+height) and columns [x0, x0+width) of the primary image
// (0-indexed) of the first image HDU. The region must lie inside the image.
Matrix2Df read_fits_region(const fs::path& path, int x0, int y0, int width, int height);

// Complete single-HDU FITS file, built in memory
std::vector<uint8_t> encode_fits_float(const Matrix2Df& data, const FitsHeader& header);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace sky_cutout::io
