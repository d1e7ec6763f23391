#include "cli_shared.hpp"

#include "sky_cutout/core/utils.hpp"

#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>

namespace sky_cutout_cli {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
    if (c == EOF)
        return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
}

std::string format_bytes(uint64_t bytes) {
    const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    if (u == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
    }
    return buf;
}

std::vector<std::string> collect_list_args(int argc, char *argv[], const char *name) {
    std::vector<std::string> out;
    for (int i = 2; i < argc - 1; ++i) {
        if (std::strcmp(argv[i], name) == 0) {
            for (const auto &part : sky_cutout::core::split(argv[i + 1], ',')) {
                std::string p = sky_cutout::core::trim(part);
                if (!p.empty()) out.push_back(p);
            }
            ++i;
        }
    }
    return out;
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

} // namespace sky_cutout_cli
