#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <locale>
#include <string>
#include <system_error>

namespace sky_cutout_test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("sky_cutout_" + tag + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

// Installs a global C++ locale whose decimal point is ',' for its lifetime
class CommaDecimalLocale {
public:
    CommaDecimalLocale()
        : previous_(std::locale::global(std::locale(std::locale::classic(), new Punct))) {}
    ~CommaDecimalLocale() { std::locale::global(previous_); }

    CommaDecimalLocale(const CommaDecimalLocale&) = delete;
    CommaDecimalLocale& operator=(const CommaDecimalLocale&) = delete;

private:
    struct Punct : std::numpunct<char> {
        char do_decimal_point() const override { return ','; }
    };

    std::locale previous_;
};

} // namespace sky_cutout_test
