#include "utils.hpp"
#include <platform/platform.hpp>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) {
        return platform::home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::string base_name(const std::filesystem::path& path) {
    // "dir/" has an empty filename(); fall back to the parent's name
    auto name = path.filename();
    if (name.empty() || name == ".") {
        name = path.parent_path().filename();
    }
    return name.empty() ? std::string(".") : name.string();
}
