#pragma once

#include "secret_detector.hpp"
#include "pattern_registry.hpp"
#include <memory>

namespace leakscan {

class RegexSecretDetector : public SecretDetector {
public:
    static constexpr std::string_view kToolName = "RegexScanner";

    explicit RegexSecretDetector(std::shared_ptr<const PatternRegistry> registry);

    std::string_view name() const override { return kToolName; }

    // Line-by-line scan in time linear in the content. Fails only when
    // cancelled.
    std::expected<std::vector<SecretFinding>, DetectorErrorInfo> scan(
        std::string_view content,
        const std::string& source_url,
        std::stop_token stop = {}
    ) const override;

    const PatternRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const PatternRegistry> registry_;
};

} // namespace leakscan
