#pragma once

#include "secret_finding.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <expected>
#include <mutex>

namespace leakscan {

enum class StoreError {
    NotConfigured,
    IOError,
    HashFailed
};

struct StoreErrorInfo {
    StoreError error;
    std::string message;
};

// Persistence collaborator of the orchestrator. Must be safe for concurrent use.
class FindingStore {
public:
    virtual ~FindingStore() = default;
    virtual std::expected<void, StoreErrorInfo> store_secret_findings(const std::vector<SecretFinding>& findings) = 0;
};

// Appends findings as JSON lines to <base>/secrets/secrets.jsonl, skipping
// any (source_url, secret_text) pair the file already holds.
class SecretsStore : public FindingStore {
public:
    explicit SecretsStore(std::filesystem::path base_dir);

    std::expected<void, StoreErrorInfo> store_secret_findings(const std::vector<SecretFinding>& findings) override;

    // Every finding in the file; corrupt lines are logged and skipped
    std::expected<std::vector<SecretFinding>, StoreErrorInfo> load_findings() const;

    const std::filesystem::path& file_path() const { return file_path_; }

    // Hex SHA-256 of source_url|rule_id|secret_text
    static std::expected<std::string, StoreErrorInfo> fingerprint(const SecretFinding& finding);

private:
    std::filesystem::path base_dir_;
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;

    std::expected<std::vector<SecretFinding>, StoreErrorInfo> load_locked() const;
};

} // namespace leakscan
