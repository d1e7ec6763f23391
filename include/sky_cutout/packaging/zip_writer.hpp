#pragma once

#include "sky_cutout/core/types.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace sky_cutout::packaging {

// Minimal ZIP archive writer (deflate via zlib).
// Entries are written in the order they are added; finish() appends the
// central directory. ZIP64 records are written only where an entry, an offset
// or the entry count exceeds the classic 16/32-bit fields. Destroying an
// unfinished writer leaves an invalid archive behind, so callers write to a
// temporary name and rename.
class ZipWriter {
public:
    ZipWriter(const fs::path& path, int compression_level);
    ~ZipWriter() = default;

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    void add(const std::string& name, const std::vector<uint8_t>& data);
    void add_file(const std::string& name, const fs::path& source);

    // Returns the archive size in bytes
    uint64_t finish();

    size_t entry_count() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        uint32_t crc = 0;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint64_t offset = 0;
        uint16_t method = 0;
    };

    void write_central_header(const Entry& e);
    void write_end_records(uint64_t cd_offset, uint64_t cd_size);

    void write_bytes(const void* data, size_t len);
    void put16(uint16_t v);
    void put32(uint32_t v);
    void put64(uint64_t v);

    fs::path path_;
    std::ofstream out_;
    int level_;
    uint16_t dos_time_ = 0;
    uint16_t dos_date_ = 0;
    uint64_t offset_ = 0;
    bool finished_ = false;
    std::vector<Entry> entries_;
};

// Raw deflate of a buffer (no zlib header)
std::vector<uint8_t> deflate_raw(const std::vector<uint8_t>& data, int level);

} // namespace sky_cutout::packaging
