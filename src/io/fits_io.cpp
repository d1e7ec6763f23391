#include "sky_cutout/io/fits_io.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace sky_cutout::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, const char* value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text) + " (status " + std::to_string(status) + ")";
}

// Structural keywords are rewritten by cfitsio itself
bool is_structural_key(const std::string& key) {
    return key == "SIMPLE" || key == "BITPIX" || key == "EXTEND" || key == "END" ||
           key == "XTENSION" || key == "PCOUNT" || key == "GCOUNT" ||
           key == "BZERO" || key == "BSCALE" || key == "CHECKSUM" || key == "DATASUM" ||
           core::starts_with(key, "NAXIS");
}

FitsHeader read_header_cards(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F': {
                // FITS allows a D exponent
                std::string num = val_str;
                std::replace(num.begin(), num.end(), 'D', 'E');
                if (auto v = core::parse_double(num)) {
                    header.set(key, *v);
                } else {
                    header.set(key, val_str);
                }
                break;
            }
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

void write_header_cards(fitsfile* fptr, const FitsHeader& header, int* status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8 && !is_structural_key(key)) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, status);
        }
    }
}

void write_image(fitsfile* fptr, const Matrix2Df& data, const FitsHeader& header,
                 const std::string& what) {
    int status = 0;
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        throw FitsError("Cannot create FITS image " + what + ": " + fits_status_text(status));
    }

    write_header_cards(fptr, header, &status);
    if (status) {
        throw FitsError("Cannot write FITS header " + what + ": " + fits_status_text(status));
    }

    // RowMajor storage matches the FITS pixel order (x fastest)
    std::vector<float> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()),
                   buffer.data(), &status);
    if (status) {
        throw FitsError("Cannot write FITS pixel data " + what + ": " +
                        fits_status_text(status));
    }
}

void open_image(fitsfile** fptr, const fs::path& path, int* width, int* height) {
    int status = 0;
    if (fits_open_image(fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + ": " +
                        fits_status_text(status));
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(*fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(*fptr, &close_status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2) {
        int close_status = 0;
        fits_close_file(*fptr, &close_status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }
    *width = static_cast<int>(naxes[0]);
    *height = static_cast<int>(naxes[1]);
}

} // namespace

FitsImageInfo read_fits_image_info(const fs::path& path) {
    fitsfile* fptr = nullptr;
    FitsImageInfo info;
    open_image(&fptr, path, &info.width, &info.height);
    info.header = read_header_cards(fptr);

    int status = 0;
    fits_close_file(fptr, &status);
    return info;
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int width = 0;
    int height = 0;
    open_image(&fptr, path, &width, &height);

    int status = 0;
    Matrix2Df data(height, width);
    long fpixel[3] = {1, 1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    fits_read_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), &nulval,
                  data.data(), nullptr, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header = read_header_cards(fptr);
    fits_close_file(fptr, &status);
    return {data, header};
}

Matrix2Df read_fits_region(const fs::path& path, int x0, int y0, int width, int height) {
    fitsfile* fptr = nullptr;
    int img_w = 0;
    int img_h = 0;
    open_image(&fptr, path, &img_w, &img_h);

    int status = 0;
    if (width <= 0 || height <= 0 || x0 < 0 || y0 < 0 ||
        x0 + width > img_w || y0 + height > img_h) {
        fits_close_file(fptr, &status);
        throw FitsError("Region outside image " + path.string());
    }

    // 1-indexed inclusive corners
    long fpixel[2] = {x0 + 1, y0 + 1};
    long lpixel[2] = {x0 + width, y0 + height};
    long inc[2] = {1, 1};

    Matrix2Df data(height, width);
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;
    fits_read_subset(fptr, TFLOAT, fpixel, lpixel, inc, &nulval, data.data(), &anynul,
                     &status);
    if (status) {
        std::string text = fits_status_text(status);
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot read FITS region of " + path.string() + ": " + text);
    }

    fits_close_file(fptr, &status);
    return data;
}

std::vector<uint8_t> encode_fits_float(const Matrix2Df& data, const FitsHeader& header) {
    constexpr size_t kBlock = 2880;

    size_t mem_size = kBlock * 4;
    void* mem = std::malloc(mem_size);
    if (!mem) {
        throw FitsError("Cannot allocate FITS memory buffer");
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_create_memfile(&fptr, &mem, &mem_size, kBlock * 16, std::realloc, &status)) {
        std::free(mem);
        throw FitsError("Cannot create in-memory FITS file: " + fits_status_text(status));
    }

    try {
        write_image(fptr, data, header, "in memory");
    } catch (const FitsError&) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        std::free(mem);
        throw;
    }

    LONGLONG head_start = 0;
    LONGLONG data_start = 0;
    LONGLONG data_end = 0;
    fits_flush_file(fptr, &status);
    fits_get_hduaddrll(fptr, &head_start, &data_start, &data_end, &status);
    if (status) {
        std::string text = fits_status_text(status);
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        std::free(mem);
        throw FitsError("Cannot finalise in-memory FITS file: " + text);
    }

    fits_close_file(fptr, &status);

    size_t file_size = static_cast<size_t>((data_end + kBlock - 1) / kBlock * kBlock);
    file_size = std::min(file_size, mem_size);
    const auto* bytes = static_cast<const uint8_t*>(mem);
    std::vector<uint8_t> out(bytes, bytes + file_size);
    std::free(mem);

    if (status) {
        throw FitsError("Cannot close in-memory FITS file: " + fits_status_text(status));
    }
    return out;
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    try {
        write_image(fptr, data, header, path.string());
    } catch (const FitsError&) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw;
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file " + path.string() + ": " +
                        fits_status_text(status));
    }
}

} // namespace sky_cutout::io
