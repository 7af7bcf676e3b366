#include "regex_detector.hpp"
#include "compact_log.hpp"
#include "entropy.hpp"
#include "line_decoder.hpp"
#include <unordered_map>
#include <algorithm>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "RegexDetector";
constexpr size_t kContextRadius = 60;

std::string excerpt(std::string_view line, size_t pos, size_t len) {
    size_t begin = pos > kContextRadius ? pos - kContextRadius : 0;
    size_t end = std::min(line.size(), pos + len + kContextRadius);
    return std::string(line.substr(begin, end - begin));
}

} // namespace

RegexSecretDetector::RegexSecretDetector(std::shared_ptr<const PatternRegistry> registry)
    : registry_(std::move(registry)) {}

std::expected<std::vector<SecretFinding>, DetectorErrorInfo> RegexSecretDetector::scan(
    std::string_view content,
    const std::string& source_url,
    std::stop_token stop) const
{
    std::vector<SecretFinding> findings;
    if (content.empty()) return findings;

    const auto& patterns = registry_->patterns();
    auto now = std::chrono::system_clock::now();

    // Caps are per rule id over the whole scan, so rules sharing an id
    // across sources share one budget.
    std::unordered_map<std::string_view, size_t> finds_per_rule;

    LineDecoder lines(content);
    std::string_view line;
    while (lines.next(line)) {
        if (stop.stop_requested()) {
            return std::unexpected(DetectorErrorInfo{DetectorError::Cancelled, "regex scan cancelled"});
        }

        for (const auto& pattern : patterns) {
            if (pattern.max_line_length > 0 && line.size() > pattern.max_line_length) continue;

            size_t& count = finds_per_rule[pattern.rule_id];
            if (pattern.max_finds_per_rule > 0 && count >= pattern.max_finds_per_rule) continue;

            const re2::RE2& regex = *pattern.regex;
            const int groups = std::min(regex.NumberOfCapturingGroups(), 1);
            re2::StringPiece text(line.data(), line.size());
            re2::StringPiece match[2];
            size_t pos = 0;
            while (pos <= line.size() &&
                   regex.Match(text, pos, line.size(), re2::RE2::UNANCHORED, match, groups + 1)) {
                const size_t match_end = static_cast<size_t>(match[0].data() - line.data()) + match[0].size();
                pos = match[0].empty() ? match_end + 1 : match_end;

                const auto& group = (groups == 1 && match[1].data() != nullptr) ? match[1] : match[0];
                if (group.empty()) continue;
                std::string secret(group.data(), group.size());

                if (pattern.entropy_threshold > 0.0 && shannon_entropy(secret) < pattern.entropy_threshold) {
                    continue;
                }
                if (pattern.max_finds_per_rule > 0 && count >= pattern.max_finds_per_rule) break;
                count++;

                SecretFinding f;
                f.source_url = source_url;
                f.rule_id = pattern.rule_id;
                f.description = pattern.description;
                f.severity = pattern.severity;
                f.secret_text = std::move(secret);
                f.line_number = lines.line_number();
                f.timestamp = now;
                f.tool_name = std::string(kToolName);
                f.verification = Verification::Unverified;
                f.context = excerpt(line, static_cast<size_t>(group.data() - line.data()), group.size());
                findings.push_back(std::move(f));
            }
        }
    }

    compact::Log::debug(kTag, std::to_string(findings.size()) + " matches in " + source_url);
    return findings;
}

} // namespace leakscan
