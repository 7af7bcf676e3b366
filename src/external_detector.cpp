#include "external_detector.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include "line_decoder.hpp"
#include "scratch_file.hpp"
#include "severity_classifier.hpp"

namespace leakscan {

namespace {

constexpr std::string_view kTag = "ExternalDetector";

// Line number from SourceMetadata.Data.{Filesystem|Git}.line, 0 when absent
size_t reported_line(const json::Value& record) {
    const auto& data = record["SourceMetadata"]["Data"];
    for (const char* source : {"Filesystem", "Git"}) {
        const auto& line = data[source]["line"];
        if (line.is_integer() && line.as_number() >= 0.0) return static_cast<size_t>(line.as_int());
    }
    return 0;
}

const std::string* first_string(const json::Value& record, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto& v = record[key];
        if (v.is_string() && !v.as_string().empty()) return &v.as_string();
    }
    return nullptr;
}

} // namespace

ExternalToolDetector::ExternalToolDetector(
    ExternalToolOptions options,
    std::shared_ptr<const ProcessRunner> runner)
    : options_(std::move(options))
    , runner_(std::move(runner))
{
}

std::vector<std::string> ExternalToolDetector::build_args(const std::filesystem::path& target) const {
    std::vector<std::string> args = {"filesystem", target.string(), "--json"};
    if (options_.no_verification) args.emplace_back("--no-verification");
    return args;
}

std::expected<SecretFinding, std::string> ExternalToolDetector::parse_record(
    std::string_view line,
    const std::string& source_url)
{
    auto doc = json::parse(line);
    if (!doc) {
        return std::unexpected("invalid JSON at offset " + std::to_string(doc.error().offset) + ": " +
                               doc.error().message);
    }
    if (!doc->is_object()) return std::unexpected(std::string("record is not an object"));

    const auto& record = *doc;
    const auto& detector = record["DetectorName"];
    if (!detector.is_string() || detector.as_string().empty()) {
        return std::unexpected(std::string("record has no DetectorName"));
    }
    const std::string* raw = first_string(record, {"Raw", "RawV2", "Redacted"});
    if (!raw) return std::unexpected("record for " + detector.as_string() + " has no secret value");

    SecretFinding f;
    f.source_url = source_url;
    f.rule_id = detector.as_string();
    const auto& rule = record["RuleName"];
    const std::string rule_name = rule.is_string() ? rule.as_string() : std::string();
    f.description = detector.as_string() + " secret detected by " + std::string(kToolName);
    if (!rule_name.empty()) f.description += " (rule " + rule_name + ")";
    f.secret_text = *raw;
    f.line_number = reported_line(record);
    f.timestamp = std::chrono::system_clock::now();
    f.tool_name = std::string(kToolName);
    f.verification = (record["Verified"].is_bool() && record["Verified"].as_bool())
        ? Verification::Verified
        : Verification::Unverified;
    f.severity = classify_severity(f.rule_id, rule_name, f.verification);

    const auto& extra = record["ExtraData"];
    if (!extra.is_null()) f.extra_data = json::dump(extra);

    return f;
}

std::vector<SecretFinding> ExternalToolDetector::parse_output(
    std::string_view output,
    const std::string& source_url,
    const std::filesystem::path& scratch_file)
{
    std::vector<SecretFinding> findings;
    LineDecoder lines(output);
    std::string_view line;
    size_t skipped = 0;

    while (lines.next(line)) {
        if (line.find_first_not_of(" \t") == std::string_view::npos) continue;

        auto finding = parse_record(line, source_url);
        if (!finding) {
            skipped++;
            compact::Log::warn(kTag, "skipping output line " + std::to_string(lines.line_number()) +
                                     " for " + source_url + ": " + finding.error());
            continue;
        }
        if (!scratch_file.empty()) finding->scratch_file = scratch_file;
        findings.push_back(std::move(*finding));
    }

    if (skipped > 0) {
        compact::Log::info(kTag, std::to_string(findings.size()) + " records parsed, " +
                                 std::to_string(skipped) + " skipped for " + source_url);
    }
    return findings;
}

std::expected<std::vector<SecretFinding>, DetectorErrorInfo> ExternalToolDetector::scan(
    std::string_view content,
    const std::string& source_url,
    std::stop_token stop) const
{
    if (content.empty()) return std::vector<SecretFinding>{};

    auto scratch = ScratchFile::create(content, options_.scratch_dir);
    if (!scratch) {
        return std::unexpected(DetectorErrorInfo{DetectorError::ScratchFileFailed, scratch.error().message});
    }

    ProcessSpec spec;
    spec.binary = options_.binary_path;
    spec.args = build_args(scratch->path());
    spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout);

    compact::Log::debug(kTag, "running " + spec.binary + " on " + scratch->path().string() + " for " + source_url);

    auto run = runner_->run(spec, stop);
    if (!run) {
        switch (run.error().error) {
            case ProcessError::Timeout:
                return std::unexpected(DetectorErrorInfo{DetectorError::Timeout, run.error().message});
            case ProcessError::Cancelled:
                return std::unexpected(DetectorErrorInfo{DetectorError::Cancelled, run.error().message});
            case ProcessError::SpawnFailed:
                return std::unexpected(DetectorErrorInfo{DetectorError::SpawnFailed, run.error().message});
            default:
                return std::unexpected(DetectorErrorInfo{DetectorError::ToolFailed, run.error().message});
        }
    }

    // A late failure (self-update check, telemetry) can follow valid output
    if (run->exit_code != 0) {
        std::string tail = run->stderr_tail;
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
        compact::Log::warn(kTag, spec.binary + " exited with code " + std::to_string(run->exit_code) +
                                 " for " + source_url + ", parsing its output anyway" +
                                 (tail.empty() ? std::string() : ": " + tail));
    }

    return parse_output(run->stdout_data, source_url, scratch->path());
}

} // namespace leakscan
