#include "sky_cutout/core/utils.hpp"
#include "sky_cutout/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <thread>

#include <openssl/evp.h>

namespace sky_cutout::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

// Random (version 4) UUID text
std::string new_task_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dis(0, 15);

    const char* hex = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id += '-';
        }
        int v = dis(gen);
        if (i == 12) {
            v = 4;
        } else if (i == 16) {
            v = (v & 0x3) | 0x8;
        }
        id += hex[v];
    }
    return id;
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

void write_bytes_atomic(const fs::path& path, const std::vector<uint8_t>& data) {
    static std::atomic<unsigned long> counter{0};

    std::ostringstream suffix;
    suffix << ".tmp." << std::hash<std::thread::id>{}(std::this_thread::get_id())
           << '.' << counter.fetch_add(1);
    fs::path tmp = path;
    tmp += suffix.str();

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw IOError("Cannot write file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw IOError("Cannot rename " + tmp.string() + " to " + path.string() +
                      ": " + ec.message());
    }
}

void safe_hardlink_or_copy(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::create_hard_link(src, dst, ec);
    if (ec) {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    }
}

namespace {

class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw SkyCutoutError("Cannot initialise SHA-256 digest");
        }
    }
    ~DigestContext() { EVP_MD_CTX_free(ctx_); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    void update(const void* data, size_t len) {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw SkyCutoutError("SHA-256 update failed");
        }
    }

    std::string hex_digest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
            throw SkyCutoutError("SHA-256 finalisation failed");
        }
        std::ostringstream oss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    DigestContext ctx;
    ctx.update(data.data(), data.size());
    return ctx.hex_digest();
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    DigestContext ctx;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        ctx.update(buffer, static_cast<size_t>(file.gcount()));
    }
    return ctx.hex_digest();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::optional<double> parse_double(const std::string& text) {
    std::istringstream ss(text);
    ss.imbue(std::locale::classic());
    double result = 0.0;
    ss >> result;
    if (ss.fail()) return std::nullopt;
    ss >> std::ws;
    if (!ss.eof()) return std::nullopt;
    return result;
}

bool message_indicates_disk_full(const std::string& message) {
    const std::string m = to_lower(message);
    return (m.find("no space left on device") != std::string::npos) ||
           (m.find("disk full") != std::string::npos) ||
           (m.find("not enough space") != std::string::npos) ||
           (m.find("enospc") != std::string::npos);
}

} // namespace sky_cutout::core
