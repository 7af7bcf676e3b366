#include "pattern_registry.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include <fstream>
#include <sstream>
#include <cmath>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "PatternRegistry";

std::vector<PatternSpec> make_builtin_patterns() {
    return {
        {"aws-access-key-id", "AWS Access Key ID",
         R"(\b((?:AKIA|ASIA|AGPA|AIDA|AROA|ANPA|ANVA)[0-9A-Z]{16})\b)",
         Severity::High, {"akia", "aws"}, 3.0, 0, 0},
        {"aws-secret-access-key", "AWS Secret Access Key",
         R"((?i)(?:aws_secret_access_key|aws_secret_key|aws_secret)\s*[:=]\s*['"]([A-Za-z0-9/+=]{40})['"])",
         Severity::Critical, {"aws_secret"}, 4.0, 0, 0},
        {"github-pat", "GitHub Personal Access Token",
         R"(\b(ghp_[A-Za-z0-9]{36})\b)",
         Severity::Critical, {"ghp_"}, 0.0, 0, 0},
        {"github-fine-grained-pat", "GitHub Fine-Grained Personal Access Token",
         R"(\b(github_pat_[A-Za-z0-9]{22}_[A-Za-z0-9]{59})\b)",
         Severity::Critical, {"github_pat_"}, 0.0, 0, 0},
        {"github-app-token", "GitHub OAuth, user-to-server, server-to-server or refresh token",
         R"(\b((?:gho|ghu|ghs|ghr)_[A-Za-z0-9]{36})\b)",
         Severity::High, {"gho_", "ghu_", "ghs_", "ghr_"}, 0.0, 0, 0},
        {"github-token-assignment", "GitHub token assigned to a variable",
         R"((?i)github[_-]?(?:token|key|secret)\s*[:=]\s*['"]([0-9a-zA-Z]{35,40})['"])",
         Severity::High, {"github"}, 3.5, 0, 0},
        {"huggingface-token", "HuggingFace access token",
         R"(\b(hf_[A-Za-z0-9]{34,})\b)",
         Severity::High, {"hf_"}, 3.5, 0, 0},
        {"generic-sk-api-key", "Generic sk- prefixed API key",
         R"(\b(sk-[A-Za-z0-9]{32,50})\b)",
         Severity::High, {"sk-"}, 3.0, 0, 0},
        {"generic-api-key-assignment", "API key assigned to a variable",
         R"((?i)(?:api[_-]?key|apikey)\s*[:=]\s*['"]([0-9a-zA-Z]{32,64})['"])",
         Severity::Medium, {"apikey", "api_key"}, 3.5, 0, 0},
        {"jwt", "JSON Web Token",
         R"(\b(eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\.[A-Za-z0-9_/+=-]*))",
         Severity::Medium, {"eyJ"}, 3.0, 0, 0},
        {"slack-bot-token", "Slack Bot Token",
         R"((xoxb-[0-9A-Za-z-]{10,48}))",
         Severity::High, {"xoxb-"}, 0.0, 0, 0},
        {"slack-legacy-token", "Slack token (xox patterns)",
         R"((xox[pboa]-[0-9]{12}-[0-9]{12}-[0-9]{12}-[a-z0-9]{32}))",
         Severity::High, {"xoxp-", "xoxo-", "xoxa-"}, 0.0, 0, 0},
        {"slack-webhook", "Slack incoming webhook URL",
         R"((https://hooks\.slack\.com/services/T[A-Za-z0-9_]{8,}/B[A-Za-z0-9_]{8,}/[A-Za-z0-9_]{24}))",
         Severity::High, {"hooks.slack.com"}, 0.0, 0, 0},
        {"private-key", "Private key block",
         R"((-----BEGIN(?: [A-Z0-9]+)* PRIVATE KEY(?: BLOCK)?-----))",
         Severity::Critical, {"-----BEGIN"}, 0.0, 0, 0},
        {"amazon-mws-auth-token", "Amazon MWS Auth Token",
         R"((amzn\.mws\.[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}))",
         Severity::High, {"amzn.mws"}, 0.0, 0, 0},
        {"facebook-access-token", "Facebook Access Token",
         R"((EAACEdEose0cBA[0-9A-Za-z]+))",
         Severity::High, {"EAACEdEose0cBA"}, 0.0, 0, 0},
        {"facebook-oauth-secret", "Facebook app secret or token assignment",
         R"((?i)facebook[_-]?(?:app[_-]?)?(?:secret|token|key)\s*[:=]\s*['"]([0-9a-f]{32})['"])",
         Severity::High, {"facebook"}, 3.0, 0, 0},
        {"google-api-key", "Google API Key",
         R"((AIza[0-9A-Za-z_-]{35}))",
         Severity::High, {"AIza"}, 0.0, 0, 0},
        {"gcp-oauth-client-id", "Google Cloud Platform OAuth client id",
         R"(([0-9]+-[0-9A-Za-z_]{32}\.apps\.googleusercontent\.com))",
         Severity::Medium, {"googleusercontent"}, 0.0, 0, 0},
        {"google-service-account", "Google service account key file",
         R"("type"\s*:\s*"service_account")",
         Severity::High, {"service_account"}, 0.0, 0, 0},
        {"google-oauth-access-token", "Google OAuth Access Token",
         R"((ya29\.[0-9A-Za-z_-]{20,}))",
         Severity::High, {"ya29."}, 0.0, 0, 0},
        {"heroku-api-key", "Heroku API Key assignment",
         R"((?i)heroku[_-]?(?:api[_-]?key|key|token)\s*[:=]\s*['"]([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})['"])",
         Severity::High, {"heroku"}, 0.0, 0, 0},
        {"mailchimp-api-key", "MailChimp API Key",
         R"(\b([0-9a-f]{32}-us[0-9]{1,2})\b)",
         Severity::Medium, {"-us"}, 3.0, 0, 0},
        {"mailgun-api-key", "Mailgun API Key",
         R"(\b(key-[0-9a-zA-Z]{32})\b)",
         Severity::Medium, {"key-"}, 3.0, 0, 0},
        {"cloudinary-url", "Cloudinary URL with credentials",
         R"((cloudinary://[0-9]+:[A-Za-z0-9_-]+@[A-Za-z0-9_-]+))",
         Severity::High, {"cloudinary://"}, 0.0, 0, 0},
        {"firebase-url", "Firebase database URL",
         R"(([A-Za-z0-9-]+\.firebaseio\.com))",
         Severity::Low, {"firebaseio"}, 0.0, 5, 0},
        {"password-in-url", "Credentials embedded in a URL",
         R"([a-zA-Z][a-zA-Z0-9+.-]{2,9}://[^/\s:@'"]{3,20}:([^/\s:@'"]{3,20})@[A-Za-z0-9.-]+)",
         Severity::High, {"://"}, 2.5, 0, 100000},
    };
}

std::string read_file(const std::filesystem::path& path, bool& ok) {
    std::ifstream file(path, std::ios::binary);
    ok = static_cast<bool>(file);
    if (!ok) return {};
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// Field mapping for one pattern record. Returns an explanation on rejection.
std::expected<PatternSpec, std::string> spec_from_json(const json::Value& record) {
    if (!record.is_object()) return std::unexpected(std::string("record is not an object"));

    PatternSpec spec;

    const auto& rule_id = record["rule_id"];
    if (!rule_id.is_string() || rule_id.as_string().empty()) {
        return std::unexpected(std::string("'rule_id' must be a non-empty string"));
    }
    spec.rule_id = rule_id.as_string();

    const auto& pattern = record["pattern"];
    if (!pattern.is_string() || pattern.as_string().empty()) {
        return std::unexpected(std::string("'pattern' must be a non-empty string"));
    }
    spec.pattern = pattern.as_string();

    const auto& description = record["description"];
    if (description.is_string()) {
        spec.description = description.as_string();
    } else if (!description.is_null()) {
        return std::unexpected(std::string("'description' must be a string"));
    }
    if (spec.description.empty()) spec.description = spec.rule_id;

    const auto& severity = record["severity"];
    if (severity.is_string()) {
        auto parsed = parse_severity(severity.as_string());
        if (!parsed) return std::unexpected("unknown severity '" + severity.as_string() + "'");
        spec.severity = *parsed;
    } else if (!severity.is_null()) {
        return std::unexpected(std::string("'severity' must be a string"));
    }

    const auto& keywords = record["keywords"];
    if (keywords.is_array()) {
        for (const auto& kw : keywords.as_array()) {
            if (!kw.is_string()) return std::unexpected(std::string("'keywords' must contain only strings"));
            spec.keywords.push_back(kw.as_string());
        }
    } else if (!keywords.is_null()) {
        return std::unexpected(std::string("'keywords' must be an array"));
    }

    const auto& entropy = record["entropy"];
    if (entropy.is_number()) {
        if (entropy.as_number() < 0.0 || !std::isfinite(entropy.as_number())) {
            return std::unexpected(std::string("'entropy' must be >= 0"));
        }
        spec.entropy_threshold = entropy.as_number();
    } else if (!entropy.is_null()) {
        return std::unexpected(std::string("'entropy' must be a number"));
    }

    auto read_count = [&](const char* field, size_t& out) -> std::optional<std::string> {
        const auto& v = record[field];
        if (v.is_null()) return std::nullopt;
        if (!v.is_integer() || v.as_number() < 0.0) {
            return std::string("'") + field + "' must be a non-negative integer";
        }
        out = static_cast<size_t>(v.as_int());
        return std::nullopt;
    };
    if (auto err = read_count("max_finds", spec.max_finds_per_rule)) return std::unexpected(*err);
    if (auto err = read_count("line_length", spec.max_line_length)) return std::unexpected(*err);

    return spec;
}

void append_layer(std::vector<RegexPattern>& out, const std::vector<PatternSpec>& specs,
                  PatternOrigin origin, std::string_view label) {
    size_t loaded = 0;
    for (const auto& spec : specs) {
        auto compiled = PatternRegistry::compile(spec, origin);
        if (!compiled) {
            compact::Log::warn(kTag, "skipping pattern '" + spec.rule_id + "' from " + std::string(label) +
                                     ": " + compiled.error());
            continue;
        }
        out.push_back(std::move(*compiled));
        loaded++;
    }
    compact::Log::info(kTag, "loaded " + std::to_string(loaded) + " of " + std::to_string(specs.size()) +
                             " patterns from " + std::string(label));
}

} // namespace

std::string_view to_string(PatternOrigin origin) {
    switch (origin) {
        case PatternOrigin::Builtin: return "builtin";
        case PatternOrigin::Custom: return "custom";
        case PatternOrigin::Extended: return "extended";
    }
    return "unknown";
}

DirectoryAssetProvider::DirectoryAssetProvider(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

std::optional<std::string> DirectoryAssetProvider::read(std::string_view name) const {
    auto path = dir_ / std::filesystem::path(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
    bool ok = false;
    auto content = read_file(path, ok);
    if (!ok) return std::nullopt;
    return content;
}

void MemoryAssetProvider::add(std::string name, std::string content) {
    assets_.insert_or_assign(std::move(name), std::move(content));
}

std::optional<std::string> MemoryAssetProvider::read(std::string_view name) const {
    auto it = assets_.find(name);
    if (it == assets_.end()) return std::nullopt;
    return it->second;
}

std::vector<PatternSpec> RegistrySources::builtin_patterns() {
    return make_builtin_patterns();
}

std::expected<RegexPattern, std::string> PatternRegistry::compile(const PatternSpec& spec, PatternOrigin origin) {
    if (spec.pattern.empty()) return std::unexpected(std::string("empty pattern"));

    re2::RE2::Options options;
    options.set_log_errors(false);
    auto regex = std::make_shared<const re2::RE2>(spec.pattern, options);
    if (!regex->ok()) return std::unexpected("invalid regex: " + regex->error());

    RegexPattern compiled;
    compiled.regex = std::move(regex);
    compiled.rule_id = spec.rule_id;
    compiled.description = spec.description;
    compiled.source = spec.pattern;
    compiled.severity = spec.severity;
    compiled.keywords = spec.keywords;
    compiled.entropy_threshold = spec.entropy_threshold;
    compiled.max_finds_per_rule = spec.max_finds_per_rule;
    compiled.max_line_length = spec.max_line_length;
    compiled.origin = origin;
    return compiled;
}

std::vector<PatternSpec> PatternRegistry::parse_pattern_document(std::string_view text, std::string_view label) {
    std::vector<PatternSpec> specs;

    auto doc = json::parse(text);
    if (!doc) {
        compact::Log::warn(kTag, std::string(label) + " is not valid JSON (offset " +
                                 std::to_string(doc.error().offset) + "): " + doc.error().message);
        return specs;
    }

    const json::Value* records = &*doc;
    if (doc->is_object()) records = &(*doc)["patterns"];
    if (!records->is_array()) {
        compact::Log::warn(kTag, std::string(label) + " must be an array of patterns or an object with a 'patterns' array");
        return specs;
    }

    size_t index = 0;
    for (const auto& record : records->as_array()) {
        auto spec = spec_from_json(record);
        if (!spec) {
            compact::Log::warn(kTag, std::string(label) + ": skipping record #" + std::to_string(index) +
                                     ": " + spec.error());
        } else {
            specs.push_back(std::move(*spec));
        }
        index++;
    }
    return specs;
}

std::expected<PatternRegistry, RegistryErrorInfo> PatternRegistry::create(const RegistrySources& sources) {
    std::vector<RegexPattern> patterns;
    patterns.reserve(sources.builtin.size());

    for (const auto& spec : sources.builtin) {
        auto compiled = compile(spec, PatternOrigin::Builtin);
        if (!compiled) {
            return std::unexpected(RegistryErrorInfo{
                RegistryError::BuiltinPatternInvalid,
                "builtin pattern '" + spec.rule_id + "' does not compile: " + compiled.error()
            });
        }
        patterns.push_back(std::move(*compiled));
    }
    compact::Log::debug(kTag, "compiled " + std::to_string(patterns.size()) + " builtin patterns");

    if (!sources.custom_file.empty()) {
        bool ok = false;
        auto text = read_file(sources.custom_file, ok);
        if (!ok) {
            compact::Log::warn(kTag, "cannot read custom pattern file " + sources.custom_file.string() + ", skipping it");
        } else {
            auto label = "custom file " + sources.custom_file.string();
            append_layer(patterns, parse_pattern_document(text, label), PatternOrigin::Custom, label);
        }
    }

    if (sources.assets) {
        auto text = sources.assets->read(kExtendedCatalogAsset);
        if (!text) {
            compact::Log::info(kTag, "extended pattern catalog not available");
        } else {
            auto label = std::string("extended catalog");
            append_layer(patterns, parse_pattern_document(*text, label), PatternOrigin::Extended, label);
        }
    }

    return PatternRegistry(std::move(patterns));
}

} // namespace leakscan
