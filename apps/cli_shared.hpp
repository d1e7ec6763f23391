#pragma once

#include <cstdint>
#include <streambuf>
#include <string>
#include <vector>

namespace sky_cutout_cli {

// Writes every character to two stream buffers
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf *a_;
    std::streambuf *b_;
};

std::string format_bytes(uint64_t bytes);

// "--band NIR-Y --band NIR-J,NIR-H" -> {NIR-Y, NIR-J, NIR-H}
std::vector<std::string> collect_list_args(int argc, char *argv[], const char *name);

std::string read_stdin();

} // namespace sky_cutout_cli
