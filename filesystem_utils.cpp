#include "filesystem_utils.h"
#include <cstdlib>

namespace gptcli {
namespace utils {

std::filesystem::path get_home_directory_path() {
    #ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        if (userprofile) {
            return std::filesystem::path(userprofile);
        }
    #else // POSIX-like systems
        const char* home_env = std::getenv("HOME");
        if (home_env) {
            return std::filesystem::path(home_env);
        }
    #endif
    return std::filesystem::path();
}

std::filesystem::path default_config_path() {
    std::filesystem::path home = get_home_directory_path();
    if (home.empty()) {
        return std::filesystem::path("config.json");
    }
    return home / ".gptcli" / "config.json";
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace utils
} // namespace gptcli
