#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>

// Wire format of the remote-copy (scp) protocol, single file, no recursion.
//
//   C<mode-octal> <size-decimal> <name>\n   control line
//   <size raw bytes>                         payload
//   \0                                       end of payload
//
// The receiving side acknowledges each step with one status byte:
// 0 = ok, 1 = warning, 2 = fatal; 1 and 2 are followed by a message line.

struct ControlLine {
    uint32_t mode;   // permission bits, 0..07777
    uint64_t size;
    std::string name;
};

inline constexpr char SCP_ACK = '\0';
inline constexpr char SCP_WARNING = '\1';
inline constexpr char SCP_FATAL = '\2';

// "C0644 10000 data.bin\n"
std::string build_control_line(const ControlLine& line);

// Parse a control line without its trailing newline. Any malformed line is
// an ErrorKind::TransferProtocol error whose message is the line itself.
Result<ControlLine> parse_control_line(const std::string& line);

// "rm -f <dest> ; scp -t <dest>"
std::string scp_sink_command(const std::string& dest);

// "scp -qrf <src>"
std::string scp_source_command(const std::string& src);
