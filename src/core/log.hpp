#pragma once

#include <string>
#include <core/types.hpp>

// Debug log file; defaults to <tmp>/fleet_debug.log.
std::string fleet_log_path();
void set_fleet_log_path(const std::string& path);

// Append a timestamped line to the debug log. Safe to call from any thread.
void fleet_log(const std::string& msg);

// Record a remote command and its outcome.
void fleet_log_ssh(const std::string& label, const std::string& cmd,
                   const SSHResult& r);
