#pragma once

#include "secret_finding.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <filesystem>
#include <expected>
#include <re2/re2.h>

namespace leakscan {

enum class PatternOrigin {
    Builtin,
    Custom,
    Extended
};

std::string_view to_string(PatternOrigin origin);

// Uncompiled rule as declared in code or a pattern file
struct PatternSpec {
    std::string rule_id;
    std::string description;
    std::string pattern;
    Severity severity = Severity::Medium;
    std::vector<std::string> keywords;  // informational only, never gates a match
    double entropy_threshold = 0.0;     // 0 = disabled
    size_t max_finds_per_rule = 0;      // 0 = unbounded
    size_t max_line_length = 0;         // 0 = unbounded
};

struct RegexPattern {
    std::string rule_id;
    std::string description;
    std::string source;
    std::shared_ptr<const re2::RE2> regex;
    Severity severity = Severity::Medium;
    std::vector<std::string> keywords;
    double entropy_threshold = 0.0;
    size_t max_finds_per_rule = 0;
    size_t max_line_length = 0;
    PatternOrigin origin = PatternOrigin::Builtin;
};

// Read-only access to files shipped alongside the binary
class AssetProvider {
public:
    virtual ~AssetProvider() = default;
    virtual std::optional<std::string> read(std::string_view name) const = 0;
};

class DirectoryAssetProvider : public AssetProvider {
public:
    explicit DirectoryAssetProvider(std::filesystem::path dir);
    std::optional<std::string> read(std::string_view name) const override;

private:
    std::filesystem::path dir_;
};

class MemoryAssetProvider : public AssetProvider {
public:
    void add(std::string name, std::string content);
    std::optional<std::string> read(std::string_view name) const override;

private:
    std::map<std::string, std::string, std::less<>> assets_;
};

enum class RegistryError {
    BuiltinPatternInvalid
};

struct RegistryErrorInfo {
    RegistryError error;
    std::string message;
};

struct RegistrySources {
    std::vector<PatternSpec> builtin = builtin_patterns();
    std::filesystem::path custom_file;               // empty = none
    std::shared_ptr<const AssetProvider> assets;     // null = no extended catalog

    static std::vector<PatternSpec> builtin_patterns();
};

class PatternRegistry {
public:
    static constexpr std::string_view kExtendedCatalogAsset = "extended_patterns.json";

    // Loads builtin, custom, then extended patterns, in that order. Only a
    // builtin pattern that fails to compile is an error; bad custom or
    // extended entries are logged and skipped.
    static std::expected<PatternRegistry, RegistryErrorInfo> create(const RegistrySources& sources);

    const std::vector<RegexPattern>& patterns() const { return patterns_; }
    size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }

    // Accepts a top-level array or {"patterns": [...]}. Invalid records are
    // logged with `label` and dropped.
    static std::vector<PatternSpec> parse_pattern_document(std::string_view text, std::string_view label);

    static std::expected<RegexPattern, std::string> compile(const PatternSpec& spec, PatternOrigin origin);

private:
    explicit PatternRegistry(std::vector<RegexPattern> patterns) : patterns_(std::move(patterns)) {}

    std::vector<RegexPattern> patterns_;
};

} // namespace leakscan
