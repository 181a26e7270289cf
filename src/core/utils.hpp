#pragma once

#include <string>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~/" against the user's home directory.
std::filesystem::path expand_home(const std::string& path);

// Last element of a local path, the name scp announces for a file.
std::string base_name(const std::filesystem::path& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
