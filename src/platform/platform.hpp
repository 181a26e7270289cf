#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Value of an environment variable; nullopt when unset or empty.
std::optional<std::string> get_env(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
