#pragma once

#include "pricing_table.h"
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace gptcli {

struct CliOptions;

constexpr const char* DEFAULT_ENDPOINT = "https://api.openai.com/v1";
constexpr const char* DEFAULT_MODEL_ID = "gpt-3.5-turbo";
constexpr const char* API_KEY_ENV_VAR = "OPENAI_API_KEY";

/// Runtime configuration after file loading and overrides.
struct AppConfig {
    std::string api_key;
    std::string model = DEFAULT_MODEL_ID;
    double temperature = 1.0;
    std::optional<long long> max_tokens;
    bool markdown = true;
    bool multiline = false;
    std::string endpoint = DEFAULT_ENDPOINT;
    long timeout_seconds = 120;
    std::map<std::string, PricingEntry> pricing;  // added to / overriding the built-in table
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Writes the default configuration file if `path` does not exist.
// Returns true if a new file was written. Throws ConfigError on failure.
bool ensureConfigFile(const std::filesystem::path& path);

// Reads and parses the JSON configuration file. Throws ConfigError.
AppConfig loadConfigFile(const std::filesystem::path& path);

// Builds a configuration from parsed JSON. Throws ConfigError on bad types.
AppConfig configFromJson(const nlohmann::json& j);

// Order of precedence for the API key:
// command line option > environment variable > configuration file.
// `env_api_key` may be null.
void applyOverrides(AppConfig& config, const CliOptions& options, const char* env_api_key);

// Checks the values the request path cannot do without. Throws ConfigError.
void validateConfig(const AppConfig& config);

} // namespace gptcli
