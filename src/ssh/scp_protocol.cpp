#include "scp_protocol.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <cctype>

std::string build_control_line(const ControlLine& line) {
    return fmt::format("C{:04o} {} {}\n", line.mode & 07777, line.size, line.name);
}

static bool parse_octal(const std::string& s, uint32_t& out) {
    if (s.size() != 4) return false;
    uint32_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '7') return false;
        v = v * 8 + static_cast<uint32_t>(c - '0');
    }
    out = v;
    return true;
}

static bool parse_decimal(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 19) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    out = v;
    return true;
}

Result<ControlLine> parse_control_line(const std::string& line) {
    auto malformed = [&line]() {
        return Result<ControlLine>::Err(ErrorKind::TransferProtocol, line);
    };

    // C<mode> <size> <name>: single spaces, the name runs to end of line
    if (line.size() < 2 || line[0] != 'C') return malformed();

    auto mode_end = line.find(' ', 1);
    if (mode_end == std::string::npos) return malformed();
    auto size_end = line.find(' ', mode_end + 1);
    if (size_end == std::string::npos) return malformed();

    std::string mode = line.substr(1, mode_end - 1);
    std::string size = line.substr(mode_end + 1, size_end - mode_end - 1);
    std::string name = line.substr(size_end + 1);

    ControlLine parsed{0, 0, name};
    if (!parse_octal(mode, parsed.mode) || !parse_decimal(size, parsed.size)) {
        return malformed();
    }
    if (name.empty() || std::isspace(static_cast<unsigned char>(name.front())) ||
        name == "." || name == ".." || name.find('/') != std::string::npos) {
        return malformed();
    }
    return Result<ControlLine>::Ok(parsed);
}

std::string scp_sink_command(const std::string& dest) {
    return fmt::format(SCP_SINK_COMMAND, dest, dest);
}

std::string scp_source_command(const std::string& src) {
    return fmt::format(SCP_SOURCE_COMMAND, src);
}
