#include "app_config.h"
#include "cli_options.h"
#include "filesystem_utils.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace gptcli {

namespace {

const char* DEFAULT_CONFIG_CONTENT =
    "{\n"
    "    \"api-key\": \"INSERT API KEY HERE\",\n"
    "    \"model\": \"gpt-3.5-turbo\",\n"
    "    \"temperature\": 1,\n"
    "    \"markdown\": true\n"
    "}\n";

std::string readString(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("Configuration key '") + key + "' must be a string");
    }
    return utils::trim(value.get<std::string>());
}

bool readBool(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_boolean()) {
        throw ConfigError(std::string("Configuration key '") + key + "' must be true or false");
    }
    return value.get<bool>();
}

double readRate(const nlohmann::json& entry, const std::string& model, const char* key) {
    if (!entry.contains(key) || !entry[key].is_number() || entry[key].get<double>() < 0.0) {
        throw ConfigError("Pricing for '" + model + "' needs a non-negative '" + key + "' rate");
    }
    return entry[key].get<double>();
}

} // namespace

bool ensureConfigFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return false;
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ConfigError("Could not create configuration directory " +
                              path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file) {
        throw ConfigError("Could not create configuration file " + path.string());
    }
    file << DEFAULT_CONFIG_CONTENT;
    if (!file) {
        throw ConfigError("Could not write configuration file " + path.string());
    }
    return true;
}

AppConfig loadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Configuration file not found: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid configuration file " + path.string() + ": " + e.what());
    }
    return configFromJson(j);
}

AppConfig configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    AppConfig c;
    if (j.contains("api-key")) c.api_key = readString(j, "api-key");

    if (!j.contains("model")) {
        throw ConfigError("Configuration is missing the 'model' key");
    }
    c.model = readString(j, "model");

    if (j.contains("temperature")) {
        if (!j["temperature"].is_number()) {
            throw ConfigError("Configuration key 'temperature' must be a number");
        }
        c.temperature = j["temperature"].get<double>();
    }

    if (j.contains("max_tokens") && !j["max_tokens"].is_null()) {
        if (!j["max_tokens"].is_number_integer() || j["max_tokens"].get<long long>() <= 0) {
            throw ConfigError("Configuration key 'max_tokens' must be a positive integer");
        }
        c.max_tokens = j["max_tokens"].get<long long>();
    }

    if (j.contains("markdown")) c.markdown = readBool(j, "markdown");
    if (j.contains("multiline")) c.multiline = readBool(j, "multiline");

    if (j.contains("endpoint")) {
        c.endpoint = readString(j, "endpoint");
        while (!c.endpoint.empty() && c.endpoint.back() == '/') {
            c.endpoint.pop_back();
        }
    }

    if (j.contains("timeout")) {
        if (!j["timeout"].is_number_integer() || j["timeout"].get<long>() <= 0) {
            throw ConfigError("Configuration key 'timeout' must be a positive number of seconds");
        }
        c.timeout_seconds = j["timeout"].get<long>();
    }

    if (j.contains("pricing")) {
        if (!j["pricing"].is_object()) {
            throw ConfigError("Configuration key 'pricing' must be an object");
        }
        for (auto& [model, entry] : j["pricing"].items()) {
            if (!entry.is_object()) {
                throw ConfigError("Pricing for '" + model + "' must be an object");
            }
            c.pricing[model] = PricingEntry{readRate(entry, model, "prompt"),
                                            readRate(entry, model, "completion")};
        }
    }

    return c;
}

void applyOverrides(AppConfig& config, const CliOptions& options, const char* env_api_key) {
    if (env_api_key && env_api_key[0] != '\0') {
        config.api_key = utils::trim(env_api_key);
    }
    if (options.api_key) {
        config.api_key = utils::trim(*options.api_key);
    }
    if (options.model) {
        config.model = utils::trim(*options.model);
    }
    if (options.multiline) {
        config.multiline = true;
    }
}

void validateConfig(const AppConfig& config) {
    if (config.api_key.empty()) {
        throw ConfigError(std::string("No API key configured. Set 'api-key', ") + API_KEY_ENV_VAR + " or --key");
    }
    if (config.model.empty()) {
        throw ConfigError("No model configured");
    }
    if (config.endpoint.empty()) {
        throw ConfigError("No endpoint configured");
    }
}

} // namespace gptcli
