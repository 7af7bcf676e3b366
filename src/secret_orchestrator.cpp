#include "secret_orchestrator.hpp"
#include "compact_log.hpp"
#include "external_detector.hpp"
#include "regex_detector.hpp"

namespace leakscan {

namespace {

constexpr std::string_view kTag = "SecretDetector";
constexpr double kBytesPerMB = 1024.0 * 1024.0;

} // namespace

RegistrySources make_registry_sources(const SecretsConfig& config) {
    RegistrySources sources;
    sources.custom_file = config.custom_regex_patterns_file;
    sources.assets = std::make_shared<DirectoryAssetProvider>(resolve_assets_dir(config));
    return sources;
}

SecretDetectionOrchestrator::SecretDetectionOrchestrator(
    SecretsConfig config,
    DetectorSet detectors,
    std::shared_ptr<FindingStore> store,
    std::shared_ptr<SecretNotifier> notifier)
    : config_(std::move(config))
    , detectors_(std::move(detectors))
    , store_(std::move(store))
    , notifier_(std::move(notifier))
{
    if (notifier_) {
        alerts_ = std::make_shared<NotificationQueue>(
            notifier_, config_.notification_channel, std::chrono::seconds(config_.notification_timeout_seconds));
    }
}

std::expected<SecretDetectionOrchestrator, RegistryErrorInfo> SecretDetectionOrchestrator::create(
    const SecretsConfig& config,
    std::shared_ptr<FindingStore> store,
    std::shared_ptr<SecretNotifier> notifier)
{
    auto registry = PatternRegistry::create(make_registry_sources(config));
    if (!registry) return std::unexpected(registry.error());
    compact::Log::info(kTag, "pattern registry ready with " + std::to_string(registry->size()) + " rules");

    DetectorSet detectors;
    detectors.regex = std::make_shared<RegexSecretDetector>(
        std::make_shared<const PatternRegistry>(std::move(*registry)));

    ExternalToolOptions options;
    options.binary_path = config.external_tool_path;
    options.timeout = std::chrono::seconds(config.external_tool_timeout_seconds);
    options.no_verification = config.external_tool_no_verification;
    options.scratch_dir = config.scratch_dir;
    detectors.external = std::make_shared<ExternalToolDetector>(std::move(options));

    return SecretDetectionOrchestrator(config, std::move(detectors), std::move(store), std::move(notifier));
}

void SecretDetectionOrchestrator::run_detector(
    const SecretDetector& detector,
    std::string_view content,
    const std::string& source_url,
    std::stop_token stop,
    std::vector<SecretFinding>& out) const
{
    auto result = detector.scan(content, source_url, stop);
    if (!result) {
        compact::Log::warn(kTag, std::string(detector.name()) + " failed for " + source_url + " (" +
                                 std::string(to_string(result.error().error)) + "): " + result.error().message);
        return;
    }
    compact::Log::debug(kTag, std::string(detector.name()) + " reported " + std::to_string(result->size()) +
                              " findings for " + source_url);
    out.insert(out.end(), std::make_move_iterator(result->begin()), std::make_move_iterator(result->end()));
}

ScanResult SecretDetectionOrchestrator::scan_content(
    const std::string& source_url,
    std::string_view content,
    std::string_view content_type,
    std::stop_token stop) const
{
    ScanResult result;
    if (!config_.enabled) return result;

    if (config_.max_file_size_to_scan_mb > 0.0 &&
        static_cast<double>(content.size()) > config_.max_file_size_to_scan_mb * kBytesPerMB) {
        compact::Log::debug(kTag, "skipping " + source_url + ": " + std::to_string(content.size()) +
                                  " bytes exceeds the scan size limit");
        return result;
    }

    compact::Log::debug(kTag, "scanning " + source_url + " (" + std::to_string(content.size()) + " bytes" +
                              (content_type.empty() ? std::string() : ", " + std::string(content_type)) + ")");

    std::vector<SecretFinding> merged;
    if (config_.enable_external_tool && detectors_.external) {
        run_detector(*detectors_.external, content, source_url, stop, merged);
    }
    if (config_.enable_custom_regex && detectors_.regex) {
        run_detector(*detectors_.regex, content, source_url, stop, merged);
    }

    result.findings = deduplicate(std::move(merged));
    if (result.findings.empty()) return result;

    compact::Log::info(kTag, "found " + std::to_string(result.findings.size()) + " secrets in " + source_url);
    if (stats_callback_) stats_callback_(result.findings.size());

    if (store_) {
        if (auto stored = store_->store_secret_findings(result.findings); !stored) {
            compact::Log::error(kTag, "failed to store findings for " + source_url + ": " + stored.error().message);
            result.error = ScanErrorInfo{ScanError::PersistenceFailed, stored.error().message};
        }
    }

    if (config_.notify_on_high_severity && alerts_) {
        dispatch_notifications(result.findings);
    }
    return result;
}

void SecretDetectionOrchestrator::dispatch_notifications(const std::vector<SecretFinding>& findings) const {
    for (const auto& finding : findings) {
        if (is_high_or_critical(finding.severity)) alerts_->enqueue(finding);
    }
}

} // namespace leakscan
