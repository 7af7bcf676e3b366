#include "secrets_config.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include <fstream>
#include <sstream>
#include <functional>
#include <map>

#ifndef LEAKSCAN_INSTALL_ASSET_DIR
#define LEAKSCAN_INSTALL_ASSET_DIR "/usr/local/share/leakscan"
#endif
#ifndef LEAKSCAN_BUILD_ASSET_DIR
#define LEAKSCAN_BUILD_ASSET_DIR "assets"
#endif

namespace leakscan {

namespace {

using Setter = std::function<std::expected<void, ConfigErrorInfo>(const json::Value&)>;

std::unexpected<ConfigErrorInfo> type_error(const std::string& key, const char* expected) {
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, "'" + key + "' must be " + expected});
}

Setter bind_bool(const std::string& key, bool& target) {
    return [key, &target](const json::Value& v) -> std::expected<void, ConfigErrorInfo> {
        if (!v.is_bool()) return type_error(key, "a boolean");
        target = v.as_bool();
        return {};
    };
}

Setter bind_int(const std::string& key, int& target) {
    return [key, &target](const json::Value& v) -> std::expected<void, ConfigErrorInfo> {
        if (!v.is_integer()) return type_error(key, "an integer");
        target = static_cast<int>(v.as_int());
        return {};
    };
}

Setter bind_number(const std::string& key, double& target) {
    return [key, &target](const json::Value& v) -> std::expected<void, ConfigErrorInfo> {
        if (!v.is_number()) return type_error(key, "a number");
        target = v.as_number();
        return {};
    };
}

Setter bind_string(const std::string& key, std::string& target) {
    return [key, &target](const json::Value& v) -> std::expected<void, ConfigErrorInfo> {
        if (!v.is_string()) return type_error(key, "a string");
        target = v.as_string();
        return {};
    };
}

} // namespace

std::expected<SecretsConfig, ConfigErrorInfo> parse_secrets_config(std::string_view text) {
    auto doc = json::parse(text);
    if (!doc) {
        return std::unexpected(ConfigErrorInfo{
            ConfigError::ParseError,
            "invalid JSON at offset " + std::to_string(doc.error().offset) + ": " + doc.error().message
        });
    }
    if (!doc->is_object()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ParseError, "configuration must be a JSON object"});
    }

    const json::Value& root = doc->contains("secrets_config") ? (*doc)["secrets_config"] : *doc;
    if (!root.is_object()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ParseError, "'secrets_config' must be an object"});
    }

    SecretsConfig config;
    const std::map<std::string, Setter> fields = {
        {"enabled", bind_bool("enabled", config.enabled)},
        {"enable_external_tool", bind_bool("enable_external_tool", config.enable_external_tool)},
        {"enable_custom_regex", bind_bool("enable_custom_regex", config.enable_custom_regex)},
        {"external_tool_path", bind_string("external_tool_path", config.external_tool_path)},
        {"external_tool_timeout_seconds", bind_int("external_tool_timeout_seconds", config.external_tool_timeout_seconds)},
        {"external_tool_no_verification", bind_bool("external_tool_no_verification", config.external_tool_no_verification)},
        {"max_file_size_to_scan_mb", bind_number("max_file_size_to_scan_mb", config.max_file_size_to_scan_mb)},
        {"custom_regex_patterns_file", bind_string("custom_regex_patterns_file", config.custom_regex_patterns_file)},
        {"notify_on_high_severity", bind_bool("notify_on_high_severity", config.notify_on_high_severity)},
        {"notification_timeout_seconds", bind_int("notification_timeout_seconds", config.notification_timeout_seconds)},
        {"notification_channel", bind_string("notification_channel", config.notification_channel)},
        {"secrets_store_path", bind_string("secrets_store_path", config.secrets_store_path)},
        {"assets_dir", bind_string("assets_dir", config.assets_dir)},
        {"scratch_dir", bind_string("scratch_dir", config.scratch_dir)},
        {"log_level", bind_string("log_level", config.log_level)},
    };

    for (const auto& [key, value] : root.as_object()) {
        auto it = fields.find(key);
        if (it == fields.end()) {
            compact::Log::warn("Config", "ignoring unknown key '" + key + "'");
            continue;
        }
        if (auto r = it->second(value); !r) return std::unexpected(r.error());
    }

    if (auto r = validate(config); !r) return std::unexpected(r.error());
    return config;
}

std::expected<SecretsConfig, ConfigErrorInfo> load_secrets_config(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ConfigErrorInfo{ConfigError::FileNotFound, "cannot open " + path.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    auto config = parse_secrets_config(oss.str());
    if (!config) {
        config.error().message = path.string() + ": " + config.error().message;
    }
    return config;
}

std::expected<void, ConfigErrorInfo> validate(const SecretsConfig& config) {
    auto invalid = [](std::string msg) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, std::move(msg)});
    };

    if (config.max_file_size_to_scan_mb < 0.0) return invalid("max_file_size_to_scan_mb must be >= 0");
    if (config.external_tool_timeout_seconds <= 0) return invalid("external_tool_timeout_seconds must be > 0");
    if (config.notification_timeout_seconds <= 0) return invalid("notification_timeout_seconds must be > 0");
    if (config.enable_external_tool && config.external_tool_path.empty()) {
        return invalid("external_tool_path must be set when enable_external_tool is true");
    }
    if (!compact::parse_level(config.log_level)) return invalid("unknown log_level '" + config.log_level + "'");
    return {};
}

std::filesystem::path resolve_assets_dir(const SecretsConfig& config) {
    if (!config.assets_dir.empty()) return config.assets_dir;
    std::error_code ec;
    std::filesystem::path installed = LEAKSCAN_INSTALL_ASSET_DIR;
    if (std::filesystem::is_directory(installed, ec)) return installed;
    return LEAKSCAN_BUILD_ASSET_DIR;
}

} // namespace leakscan
