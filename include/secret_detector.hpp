#pragma once

#include "secret_finding.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <stop_token>

namespace leakscan {

enum class DetectorError {
    ScratchFileFailed,
    SpawnFailed,
    Timeout,
    Cancelled,
    ToolFailed
};

struct DetectorErrorInfo {
    DetectorError error;
    std::string message;
};

inline std::string_view to_string(DetectorError error) {
    switch (error) {
        case DetectorError::ScratchFileFailed: return "scratch file failed";
        case DetectorError::SpawnFailed: return "spawn failed";
        case DetectorError::Timeout: return "timeout";
        case DetectorError::Cancelled: return "cancelled";
        case DetectorError::ToolFailed: return "tool failed";
    }
    return "unknown";
}

// One detection engine. Implementations are immutable after construction
// and safe to call from several threads at once.
class SecretDetector {
public:
    virtual ~SecretDetector() = default;

    virtual std::string_view name() const = 0;

    virtual std::expected<std::vector<SecretFinding>, DetectorErrorInfo> scan(
        std::string_view content,
        const std::string& source_url,
        std::stop_token stop = {}
    ) const = 0;
};

} // namespace leakscan
