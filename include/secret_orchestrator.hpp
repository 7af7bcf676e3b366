#pragma once

#include "secret_detector.hpp"
#include "secrets_config.hpp"
#include "secrets_store.hpp"
#include "notifier.hpp"
#include "pattern_registry.hpp"
#include <memory>
#include <optional>
#include <functional>

namespace leakscan {

enum class ScanError {
    PersistenceFailed
};

struct ScanErrorInfo {
    ScanError error;
    std::string message;
};

// Findings are returned even when error is set: a storage failure never
// discards detection results.
struct ScanResult {
    std::vector<SecretFinding> findings;
    std::optional<ScanErrorInfo> error;

    bool ok() const { return !error.has_value(); }
};

using StatsCallback = std::function<void(size_t)>;

struct DetectorSet {
    std::shared_ptr<const SecretDetector> external;  // null = not available
    std::shared_ptr<const SecretDetector> regex;
};

// Registry layers as configured: builtins, the custom file, and the
// extended catalog from the asset directory
RegistrySources make_registry_sources(const SecretsConfig& config);

class SecretDetectionOrchestrator {
public:
    SecretDetectionOrchestrator(
        SecretsConfig config,
        DetectorSet detectors,
        std::shared_ptr<FindingStore> store = nullptr,
        std::shared_ptr<SecretNotifier> notifier = nullptr
    );

    // Builds the pattern registry and both detectors from the configuration.
    // Fails only when a builtin pattern is broken.
    static std::expected<SecretDetectionOrchestrator, RegistryErrorInfo> create(
        const SecretsConfig& config,
        std::shared_ptr<FindingStore> store = nullptr,
        std::shared_ptr<SecretNotifier> notifier = nullptr
    );

    ScanResult scan_content(
        const std::string& source_url,
        std::string_view content,
        std::string_view content_type = {},
        std::stop_token stop = {}
    ) const;

    void set_stats_callback(StatsCallback callback) { stats_callback_ = std::move(callback); }

    const SecretsConfig& config() const { return config_; }

private:
    SecretsConfig config_;
    DetectorSet detectors_;
    std::shared_ptr<FindingStore> store_;
    std::shared_ptr<SecretNotifier> notifier_;
    std::shared_ptr<NotificationQueue> alerts_;  // null when no notifier
    StatsCallback stats_callback_;

    void run_detector(const SecretDetector& detector, std::string_view content, const std::string& source_url,
                      std::stop_token stop, std::vector<SecretFinding>& out) const;

    void dispatch_notifications(const std::vector<SecretFinding>& findings) const;
};

} // namespace leakscan
