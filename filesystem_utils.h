#ifndef GPTCLI_FILESYSTEM_UTILS_H
#define GPTCLI_FILESYSTEM_UTILS_H

#include <filesystem>
#include <string>

namespace gptcli {
namespace utils {

    // Get the user's home directory path (cross-platform)
    // Returns an empty path if the home directory cannot be determined
    std::filesystem::path get_home_directory_path();

    // ~/.gptcli/config.json, or ./config.json when there is no home directory
    std::filesystem::path default_config_path();

    // Strips leading and trailing whitespace
    std::string trim(const std::string& text);

} // namespace utils
} // namespace gptcli

#endif // GPTCLI_FILESYSTEM_UTILS_H
