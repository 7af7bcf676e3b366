#include "secrets_store.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include "line_decoder.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <set>
#include <memory>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "SecretsStore";

json::Value to_json(const SecretFinding& f, const std::string& fingerprint) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(f.timestamp.time_since_epoch()).count();
    json::Object obj = {
        {"source_url", f.source_url},
        {"rule_id", f.rule_id},
        {"description", f.description},
        {"severity", std::string(to_string(f.severity))},
        {"secret_text", f.secret_text},
        {"line_number", f.line_number},
        {"timestamp_ms", static_cast<int64_t>(ms)},
        {"tool_name", f.tool_name},
        {"verified", f.verification == Verification::Verified},
        {"context", f.context},
        {"fingerprint", fingerprint},
    };
    if (f.extra_data) obj.emplace("extra_data", *f.extra_data);
    if (f.scratch_file) obj.emplace("scratch_file", f.scratch_file->string());
    return json::Value(std::move(obj));
}

std::expected<SecretFinding, std::string> from_json(const json::Value& v) {
    if (!v.is_object()) return std::unexpected(std::string("not an object"));
    if (!v["source_url"].is_string() || !v["rule_id"].is_string() || !v["secret_text"].is_string()) {
        return std::unexpected(std::string("missing source_url, rule_id or secret_text"));
    }

    SecretFinding f;
    f.source_url = v["source_url"].as_string();
    f.rule_id = v["rule_id"].as_string();
    f.secret_text = v["secret_text"].as_string();
    if (v["description"].is_string()) f.description = v["description"].as_string();
    if (v["severity"].is_string()) {
        if (auto s = parse_severity(v["severity"].as_string())) f.severity = *s;
    }
    if (v["line_number"].is_integer()) f.line_number = static_cast<size_t>(v["line_number"].as_int());
    if (v["timestamp_ms"].is_number()) {
        f.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(v["timestamp_ms"].as_int()));
    }
    if (v["tool_name"].is_string()) f.tool_name = v["tool_name"].as_string();
    if (v["verified"].is_bool() && v["verified"].as_bool()) f.verification = Verification::Verified;
    if (v["context"].is_string()) f.context = v["context"].as_string();
    if (v["extra_data"].is_string()) f.extra_data = v["extra_data"].as_string();
    if (v["scratch_file"].is_string()) f.scratch_file = std::filesystem::path(v["scratch_file"].as_string());
    return f;
}

std::string duplicate_key(const SecretFinding& f) {
    return f.source_url + "|" + f.secret_text;
}

} // namespace

SecretsStore::SecretsStore(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir))
    , file_path_(base_dir_ / "secrets" / "secrets.jsonl")
{
}

std::expected<std::string, StoreErrorInfo> SecretsStore::fingerprint(const SecretFinding& finding) {
    std::string material = finding.source_url + "|" + finding.rule_id + "|" + finding.secret_text;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return std::unexpected(StoreErrorInfo{StoreError::HashFailed, "EVP_MD_CTX_new failed"});

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), material.data(), material.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return std::unexpected(StoreErrorInfo{StoreError::HashFailed, "SHA-256 digest failed"});
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::expected<std::vector<SecretFinding>, StoreErrorInfo> SecretsStore::load_locked() const {
    std::vector<SecretFinding> findings;
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) return findings;

    std::ifstream file(file_path_, std::ios::binary);
    if (!file) {
        return std::unexpected(StoreErrorInfo{StoreError::IOError, "cannot open " + file_path_.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    std::string content = oss.str();

    LineDecoder lines(content);
    std::string_view line;
    while (lines.next(line)) {
        if (line.empty()) continue;
        auto doc = json::parse(line);
        if (!doc) {
            compact::Log::warn(kTag, "ignoring corrupt line " + std::to_string(lines.line_number()) + " of " +
                                     file_path_.string() + ": " + doc.error().message);
            continue;
        }
        auto finding = from_json(*doc);
        if (!finding) {
            compact::Log::warn(kTag, "ignoring line " + std::to_string(lines.line_number()) + " of " +
                                     file_path_.string() + ": " + finding.error());
            continue;
        }
        findings.push_back(std::move(*finding));
    }
    return findings;
}

std::expected<std::vector<SecretFinding>, StoreErrorInfo> SecretsStore::load_findings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

std::expected<void, StoreErrorInfo> SecretsStore::store_secret_findings(const std::vector<SecretFinding>& findings) {
    if (findings.empty()) return {};
    if (base_dir_.empty()) {
        return std::unexpected(StoreErrorInfo{StoreError::NotConfigured, "secrets store path is not configured"});
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(file_path_.parent_path(), ec);
    if (ec) {
        return std::unexpected(StoreErrorInfo{StoreError::IOError,
                                              "cannot create " + file_path_.parent_path().string() + ": " + ec.message()});
    }

    auto existing = load_locked();
    if (!existing) return std::unexpected(existing.error());

    std::set<std::string> seen;
    for (const auto& f : *existing) seen.insert(duplicate_key(f));

    std::string batch;
    size_t written = 0;
    for (const auto& f : findings) {
        if (!seen.insert(duplicate_key(f)).second) continue;
        auto fp = fingerprint(f);
        if (!fp) return std::unexpected(fp.error());
        batch += json::dump(to_json(f, *fp));
        batch += '\n';
        written++;
    }

    if (written == 0) {
        compact::Log::info(kTag, "all " + std::to_string(findings.size()) + " findings already stored");
        return {};
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out) {
        return std::unexpected(StoreErrorInfo{StoreError::IOError, "cannot open " + file_path_.string() + " for append"});
    }
    out << batch;
    out.flush();
    if (!out) {
        return std::unexpected(StoreErrorInfo{StoreError::IOError, "write to " + file_path_.string() + " failed"});
    }

    compact::Log::info(kTag, "stored " + std::to_string(written) + " new findings, " +
                             std::to_string(findings.size() - written) + " duplicates filtered, " +
                             std::to_string(existing->size() + written) + " total");
    return {};
}

} // namespace leakscan
