#include "sky_cutout/packaging/zip_writer.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <algorithm>
#include <ctime>
#include <limits>
#include <zlib.h>

namespace sky_cutout::packaging {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint32_t kZip64EndOfCentralDirSig = 0x06064b50;
constexpr uint32_t kZip64LocatorSig = 0x07064b50;
constexpr uint16_t kZip64ExtraId = 0x0001;
constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kVersionZip64 = 45;
constexpr uint16_t kVersionMadeBy = (3 << 8) | 45;  // unix, 4.5
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;
constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();
constexpr uint64_t kMax16 = std::numeric_limits<uint16_t>::max();

uint32_t crc32_of(const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const uint8_t* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        const uInt chunk = static_cast<uInt>(std::min<size_t>(left, 1u << 30));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(p), chunk);
        p += chunk;
        left -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

uint32_t clamp32(uint64_t v) {
    return v >= kMax32 ? static_cast<uint32_t>(kMax32) : static_cast<uint32_t>(v);
}

} // namespace

std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data, int level) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        throw PackagingError("entry too large for deflate: " + std::to_string(data.size()));
    }

    z_stream zs{};
    int rc = deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw PackagingError("deflateInit2 failed: " + std::to_string(rc));
    }

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    rc = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw PackagingError("deflate failed: " + std::to_string(rc));
    }

    out.resize(produced);
    return out;
}

ZipWriter::ZipWriter(const fs::path& path, int compression_level)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc), level_(compression_level) {
    if (!out_) {
        throw PackagingError("cannot create archive " + path.string());
    }

    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    int year = std::max(tm_buf.tm_year + 1900, 1980);
    dos_time_ = static_cast<uint16_t>((tm_buf.tm_hour << 11) | (tm_buf.tm_min << 5) |
                                      (tm_buf.tm_sec / 2));
    dos_date_ = static_cast<uint16_t>(((year - 1980) << 9) | ((tm_buf.tm_mon + 1) << 5) |
                                      tm_buf.tm_mday);
}

void ZipWriter::write_bytes(const void* data, size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out_) {
        throw PackagingError("write failed on " + path_.string());
    }
    offset_ += len;
}

void ZipWriter::put16(uint16_t v) {
    uint8_t b[2] = {static_cast<uint8_t>(v & 0xff), static_cast<uint8_t>(v >> 8)};
    write_bytes(b, 2);
}

void ZipWriter::put32(uint32_t v) {
    uint8_t b[4] = {static_cast<uint8_t>(v & 0xff), static_cast<uint8_t>((v >> 8) & 0xff),
                    static_cast<uint8_t>((v >> 16) & 0xff), static_cast<uint8_t>(v >> 24)};
    write_bytes(b, 4);
}

void ZipWriter::put64(uint64_t v) {
    put32(static_cast<uint32_t>(v & 0xffffffffu));
    put32(static_cast<uint32_t>(v >> 32));
}

void ZipWriter::add(const std::string& name, const std::vector<uint8_t>& data) {
    if (finished_) {
        throw PackagingError("archive already finished: " + path_.string());
    }
    if (name.empty() || name.size() > 0xffff) {
        throw PackagingError("invalid entry name '" + name + "'");
    }

    Entry e;
    e.name = name;
    e.offset = offset_;
    e.uncompressed_size = data.size();
    e.crc = crc32_of(data);

    std::vector<uint8_t> compressed;
    const std::vector<uint8_t>* payload = &data;
    e.method = kMethodStored;
    if (level_ != 0 && !data.empty() && data.size() <= std::numeric_limits<uInt>::max()) {
        compressed = deflate_raw(data, level_);
        if (compressed.size() < data.size()) {
            payload = &compressed;
            e.method = kMethodDeflated;
        }
    }
    e.compressed_size = payload->size();

    const bool zip64 = e.uncompressed_size >= kMax32 || e.compressed_size >= kMax32;

    put32(kLocalHeaderSig);
    put16(zip64 ? kVersionZip64 : kVersionNeeded);
    put16(kFlagUtf8);
    put16(e.method);
    put16(dos_time_);
    put16(dos_date_);
    put32(e.crc);
    put32(zip64 ? static_cast<uint32_t>(kMax32) : static_cast<uint32_t>(e.compressed_size));
    put32(zip64 ? static_cast<uint32_t>(kMax32) : static_cast<uint32_t>(e.uncompressed_size));
    put16(static_cast<uint16_t>(e.name.size()));
    put16(zip64 ? 20 : 0);
    write_bytes(e.name.data(), e.name.size());
    if (zip64) {
        put16(kZip64ExtraId);
        put16(16);
        put64(e.uncompressed_size);
        put64(e.compressed_size);
    }
    write_bytes(payload->data(), payload->size());

    entries_.push_back(std::move(e));
}

void ZipWriter::add_file(const std::string& name, const fs::path& source) {
    try {
        add(name, core::read_bytes(source));
    } catch (const IOError& e) {
        throw PackagingError(e.what());
    }
}

void ZipWriter::write_central_header(const Entry& e) {
    // ZIP64 extra field: only the overflowing values, in this fixed order
    std::vector<uint64_t> extra;
    if (e.uncompressed_size >= kMax32) extra.push_back(e.uncompressed_size);
    if (e.compressed_size >= kMax32) extra.push_back(e.compressed_size);
    if (e.offset >= kMax32) extra.push_back(e.offset);

    const uint16_t extra_len =
        extra.empty() ? 0 : static_cast<uint16_t>(4 + 8 * extra.size());

    put32(kCentralHeaderSig);
    put16(kVersionMadeBy);
    put16(extra.empty() ? kVersionNeeded : kVersionZip64);
    put16(kFlagUtf8);
    put16(e.method);
    put16(dos_time_);
    put16(dos_date_);
    put32(e.crc);
    put32(clamp32(e.compressed_size));
    put32(clamp32(e.uncompressed_size));
    put16(static_cast<uint16_t>(e.name.size()));
    put16(extra_len);
    put16(0);   // comment
    put16(0);   // disk
    put16(0);   // internal attributes
    put32(0100644u << 16);
    put32(clamp32(e.offset));
    write_bytes(e.name.data(), e.name.size());
    if (!extra.empty()) {
        put16(kZip64ExtraId);
        put16(static_cast<uint16_t>(8 * extra.size()));
        for (uint64_t v : extra) put64(v);
    }
}

void ZipWriter::write_end_records(uint64_t cd_offset, uint64_t cd_size) {
    const uint64_t count = entries_.size();
    const bool zip64 = count >= kMax16 || cd_offset >= kMax32 || cd_size >= kMax32;

    if (zip64) {
        const uint64_t record_offset = offset_;
        put32(kZip64EndOfCentralDirSig);
        put64(44);  // size of the remaining record
        put16(kVersionMadeBy);
        put16(kVersionZip64);
        put32(0);
        put32(0);
        put64(count);
        put64(count);
        put64(cd_size);
        put64(cd_offset);

        put32(kZip64LocatorSig);
        put32(0);
        put64(record_offset);
        put32(1);
    }

    const uint16_t count16 =
        count >= kMax16 ? static_cast<uint16_t>(kMax16) : static_cast<uint16_t>(count);
    put32(kEndOfCentralDirSig);
    put16(0);
    put16(0);
    put16(count16);
    put16(count16);
    put32(clamp32(cd_size));
    put32(clamp32(cd_offset));
    put16(0);
}

uint64_t ZipWriter::finish() {
    if (finished_) return offset_;

    const uint64_t cd_offset = offset_;
    for (const auto& e : entries_) {
        write_central_header(e);
    }
    write_end_records(cd_offset, offset_ - cd_offset);

    out_.flush();
    out_.close();
    if (out_.fail()) {
        throw PackagingError("cannot close archive " + path_.string());
    }
    finished_ = true;
    return offset_;
}

} // namespace sky_cutout::packaging
