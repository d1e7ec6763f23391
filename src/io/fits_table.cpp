#include "sky_cutout/io/fits_table.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <fitsio.h>
#include <cmath>
#include <cstdio>
#include <limits>

namespace sky_cutout::io {

struct FitsTableReader::Impl {
    fitsfile* fptr = nullptr;
};

FitsTableReader::FitsTableReader(const fs::path& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
    int status = 0;
    if (fits_open_table(&impl_->fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS table: " + path.string());
    }

    int ncols = 0;
    LONGLONG nrows = 0;
    fits_get_num_cols(impl_->fptr, &ncols, &status);
    fits_get_num_rowsll(impl_->fptr, &nrows, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(impl_->fptr, &close_status);
        throw FitsError("Cannot read FITS table layout: " + path.string());
    }
    rows_ = static_cast<size_t>(nrows);

    for (int i = 1; i <= ncols; ++i) {
        char keyname[FLEN_KEYWORD];
        char colname[FLEN_VALUE] = {0};
        std::snprintf(keyname, sizeof(keyname), "TTYPE%d", i);
        int key_status = 0;
        fits_read_key(impl_->fptr, TSTRING, keyname, colname, nullptr, &key_status);
        columns_.push_back(key_status ? std::string() : core::trim(colname));
    }
}

FitsTableReader::~FitsTableReader() {
    if (impl_ && impl_->fptr) {
        int status = 0;
        fits_close_file(impl_->fptr, &status);
    }
}

int FitsTableReader::column_number(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == name) return static_cast<int>(i) + 1;
    }
    throw FitsError("Column '" + name + "' not found in " + path_.string());
}

std::vector<double> FitsTableReader::read_double_column(const std::string& name) const {
    const int colnum = column_number(name);
    std::vector<double> values(rows_);
    if (rows_ == 0) return values;

    int status = 0;
    int anynul = 0;
    double nulval = std::numeric_limits<double>::quiet_NaN();
    fits_read_col(impl_->fptr, TDOUBLE, colnum, 1, 1, static_cast<LONGLONG>(rows_), &nulval,
                  values.data(), &anynul, &status);
    if (status) {
        throw FitsError("Cannot read column '" + name + "' as number from " + path_.string());
    }
    return values;
}

std::vector<std::string> FitsTableReader::read_string_column(const std::string& name) const {
    const int colnum = column_number(name);
    std::vector<std::string> values;
    values.reserve(rows_);
    if (rows_ == 0) return values;

    int status = 0;
    int typecode = 0;
    long repeat = 0;
    long width = 0;
    fits_get_coltype(impl_->fptr, colnum, &typecode, &repeat, &width, &status);
    if (status) {
        throw FitsError("Cannot read type of column '" + name + "' in " + path_.string());
    }

    const LONGLONG n = static_cast<LONGLONG>(rows_);
    int anynul = 0;

    if (typecode == TSTRING) {
        std::vector<std::vector<char>> storage(rows_, std::vector<char>(repeat + 1, '\0'));
        std::vector<char*> ptrs(rows_);
        for (size_t i = 0; i < rows_; ++i) ptrs[i] = storage[i].data();
        char nulstr[] = "";
        fits_read_col(impl_->fptr, TSTRING, colnum, 1, 1, n, nulstr, ptrs.data(), &anynul,
                      &status);
        if (status) {
            throw FitsError("Cannot read column '" + name + "' from " + path_.string());
        }
        for (size_t i = 0; i < rows_; ++i) values.push_back(core::trim(ptrs[i]));
    } else if (typecode == TLONGLONG || typecode == TLONG || typecode == TINT ||
               typecode == TSHORT || typecode == TBYTE || typecode == TSBYTE ||
               typecode == TUSHORT || typecode == TUINT || typecode == TULONG) {
        std::vector<LONGLONG> ints(rows_);
        LONGLONG nulval = std::numeric_limits<LONGLONG>::min();
        fits_read_col(impl_->fptr, TLONGLONG, colnum, 1, 1, n, &nulval, ints.data(), &anynul,
                      &status);
        if (status) {
            throw FitsError("Cannot read column '" + name + "' from " + path_.string());
        }
        for (LONGLONG v : ints) {
            values.push_back(v == nulval ? std::string() : std::to_string(v));
        }
    } else {
        std::vector<double> reals = read_double_column(name);
        for (double v : reals) {
            if (std::isnan(v)) {
                values.emplace_back();
                continue;
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", v);
            values.emplace_back(buf);
        }
    }
    return values;
}

} // namespace sky_cutout::io
