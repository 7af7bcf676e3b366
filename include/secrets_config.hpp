#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace leakscan {

struct SecretsConfig {
    bool enabled = true;                          // master switch
    bool enable_external_tool = true;             // run the external scanner
    bool enable_custom_regex = true;              // run the regex engine
    std::string external_tool_path = "trufflehog";
    int external_tool_timeout_seconds = 60;
    bool external_tool_no_verification = true;    // skip live credential checks
    double max_file_size_to_scan_mb = 5.0;        // 0 = no limit
    std::string custom_regex_patterns_file;       // empty = builtin + extended only
    bool notify_on_high_severity = true;
    int notification_timeout_seconds = 10;
    std::string notification_channel = "secrets";
    std::string secrets_store_path;               // empty = findings are not persisted
    std::string assets_dir;                       // empty = directory installed with the binary
    std::string scratch_dir;                      // empty = system temp dir
    std::string log_level = "info";
};

enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
};

// Overlays the keys found in a JSON file on the defaults. The document may
// hold the keys at top level or under "secrets_config".
std::expected<SecretsConfig, ConfigErrorInfo> load_secrets_config(const std::filesystem::path& path);

std::expected<SecretsConfig, ConfigErrorInfo> parse_secrets_config(std::string_view text);

std::expected<void, ConfigErrorInfo> validate(const SecretsConfig& config);

// assets_dir if set, else the installed data directory, else the source
// tree's assets/ for a build that was never installed
std::filesystem::path resolve_assets_dir(const SecretsConfig& config);

} // namespace leakscan
