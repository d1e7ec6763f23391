#pragma once

#include "sky_cutout/core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sky_cutout::io {

// Read access to the first table HDU (binary or ASCII) of a FITS file
class FitsTableReader {
public:
    explicit FitsTableReader(const fs::path& path);
    ~FitsTableReader();

    FitsTableReader(const FitsTableReader&) = delete;
    FitsTableReader& operator=(const FitsTableReader&) = delete;

    const std::vector<std::string>& column_names() const { return columns_; }
    size_t row_count() const { return rows_; }

    // Null entries read as NaN
    std::vector<double> read_double_column(const std::string& name) const;

    // Integer columns render in decimal, floating columns with full precision
    std::vector<std::string> read_string_column(const std::string& name) const;

private:
    struct Impl;

    int column_number(const std::string& name) const;

    fs::path path_;
    std::unique_ptr<Impl> impl_;
    std::vector<std::string> columns_;
    size_t rows_ = 0;
};

} // namespace sky_cutout::io
