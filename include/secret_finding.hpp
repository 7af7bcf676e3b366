#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include <tuple>

namespace leakscan {

enum class Severity {
    Critical,
    High,
    Medium,
    Low,
    Info
};

enum class Verification {
    Unverified,
    Verified
};

std::string_view to_string(Severity severity);
std::string_view to_string(Verification verification);

// Case-insensitive: "critical", "HIGH", ...
std::optional<Severity> parse_severity(std::string_view name);

// HIGH and CRITICAL trigger notifications
inline bool is_high_or_critical(Severity severity) {
    return severity == Severity::Critical || severity == Severity::High;
}

struct SecretFinding {
    std::string source_url;
    std::string rule_id;
    std::string description;
    Severity severity = Severity::Medium;
    std::string secret_text;  // unredacted, treat as sensitive
    size_t line_number = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string tool_name;
    Verification verification = Verification::Unverified;
    std::optional<std::string> extra_data;  // serialized JSON, tool specific
    std::optional<std::filesystem::path> scratch_file;
    std::string context;      // excerpt of the matching line

    auto dedup_key() const {
        return std::tie(source_url, rule_id, line_number, secret_text);
    }

    bool operator==(const SecretFinding& other) const {
        return dedup_key() == other.dedup_key();
    }
};

// Stable-sorts by (source_url, rule_id, line_number, secret_text) and keeps
// the first finding for every key. Applying it twice is a no-op.
std::vector<SecretFinding> deduplicate(std::vector<SecretFinding> findings);

// "AKIA****************" style masking for display
std::string mask_secret(std::string_view secret, size_t visible = 4);

} // namespace leakscan
