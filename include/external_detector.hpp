#pragma once

#include "secret_detector.hpp"
#include "process_runner.hpp"
#include <memory>
#include <filesystem>
#include <chrono>

namespace leakscan {

struct ExternalToolOptions {
    std::string binary_path = "trufflehog";
    std::chrono::seconds timeout{60};
    bool no_verification = true;        // pass --no-verification
    std::filesystem::path scratch_dir;  // empty = system temp dir
};

// Runs a filesystem-mode scanner (TruffleHog v3 CLI contract) on a scratch
// copy of the content and maps its JSONL output to findings.
class ExternalToolDetector : public SecretDetector {
public:
    static constexpr std::string_view kToolName = "TruffleHog";

    explicit ExternalToolDetector(
        ExternalToolOptions options,
        std::shared_ptr<const ProcessRunner> runner = std::make_shared<PosixProcessRunner>()
    );

    std::string_view name() const override { return kToolName; }

    std::expected<std::vector<SecretFinding>, DetectorErrorInfo> scan(
        std::string_view content,
        const std::string& source_url,
        std::stop_token stop = {}
    ) const override;

    // Argument vector for one scan, without the binary itself
    std::vector<std::string> build_args(const std::filesystem::path& target) const;

    // Maps every valid record of a JSONL stream. Malformed lines are logged
    // and skipped; blank lines are ignored.
    static std::vector<SecretFinding> parse_output(
        std::string_view output,
        const std::string& source_url,
        const std::filesystem::path& scratch_file = {}
    );

    static std::expected<SecretFinding, std::string> parse_record(
        std::string_view line,
        const std::string& source_url
    );

    const ExternalToolOptions& options() const { return options_; }

private:
    ExternalToolOptions options_;
    std::shared_ptr<const ProcessRunner> runner_;
};

} // namespace leakscan
