#include "sky_cutout/cache/artifact_cache.hpp"
#include "sky_cutout/core/errors.hpp"
#include "sky_cutout/core/utils.hpp"

#include <system_error>

namespace sky_cutout::cache {

std::string sanitize_path_component(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool encode = false;
        switch (c) {
            case '%': case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|': case ' ':
                encode = true;
                break;
            default:
                encode = c < 0x20 || c == 0x7f;
        }
        if (encode) {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        } else {
            out += static_cast<char>(c);
        }
    }
    // "%" alone is never produced by the encoding above
    if (out.empty()) return "%";
    if (out == ".") return "%2E";
    if (out == "..") return "%2E%2E";
    return out;
}

ArtifactCache::ArtifactCache(fs::path root) : root_(std::move(root)) {}

std::string ArtifactCache::file_name_for(const ArtifactRequest& request) {
    std::string product = request.product_type;
    for (char& c : product) {
        if (c == '-') c = '_';
    }
    return sanitize_path_component(request.target_key) + "_" +
           sanitize_path_component(product) + "_" +
           std::to_string(request.size) + ".fits";
}

fs::path ArtifactCache::path_for(const ArtifactRequest& request) const {
    return root_ / sanitize_path_component(request.band) / file_name_for(request);
}

std::optional<CacheEntry> ArtifactCache::lookup(const ArtifactRequest& request) const {
    fs::path path = path_for(request);
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return CacheEntry{request, path};
    }
    return std::nullopt;
}

fs::path ArtifactCache::store(const ArtifactRequest& request,
                              const std::vector<uint8_t>& bytes) const {
    fs::path path = path_for(request);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw CacheWriteError("cannot create " + path.parent_path().string() + ": " +
                              ec.message());
    }

    try {
        core::write_bytes_atomic(path, bytes);
    } catch (const IOError& e) {
        throw CacheWriteError(e.what());
    }
    return path;
}

} // namespace sky_cutout::cache
