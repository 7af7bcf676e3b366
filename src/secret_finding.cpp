#include "secret_finding.hpp"
#include <algorithm>
#include <cctype>

namespace leakscan {

std::string_view to_string(Severity severity) {
    switch (severity) {
        case Severity::Critical: return "CRITICAL";
        case Severity::High: return "HIGH";
        case Severity::Medium: return "MEDIUM";
        case Severity::Low: return "LOW";
        case Severity::Info: return "INFO";
    }
    return "UNKNOWN";
}

std::string_view to_string(Verification verification) {
    return verification == Verification::Verified ? "Verified" : "Unverified";
}

std::optional<Severity> parse_severity(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "critical") return Severity::Critical;
    if (lower == "high") return Severity::High;
    if (lower == "medium") return Severity::Medium;
    if (lower == "low") return Severity::Low;
    if (lower == "info") return Severity::Info;
    return std::nullopt;
}

std::vector<SecretFinding> deduplicate(std::vector<SecretFinding> findings) {
    std::stable_sort(findings.begin(), findings.end(), [](const SecretFinding& a, const SecretFinding& b) {
        return a.dedup_key() < b.dedup_key();
    });

    // Equal keys are adjacent after the sort, unique keeps the first of each run
    auto last = std::unique(findings.begin(), findings.end());
    findings.erase(last, findings.end());
    return findings;
}

std::string mask_secret(std::string_view secret, size_t visible) {
    if (secret.size() <= visible) return std::string(secret.size(), '*');
    std::string masked(secret.substr(0, visible));
    masked.append(secret.size() - visible, '*');
    return masked;
}

} // namespace leakscan
