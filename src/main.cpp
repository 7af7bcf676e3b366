#include "secret_orchestrator.hpp"
#include "secrets_config.hpp"
#include "secrets_store.hpp"
#include "notifier.hpp"
#include "pattern_registry.hpp"
#include "compact_log.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <condition_variable>

using namespace leakscan;

enum class FSMState {
    Init,
    ParseArgs,
    LoadConfig,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd, url, config_path, content_type;
    std::vector<std::string> args;
    SecretsConfig config;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::string result_message;
};

// Forwards to the console and lets main wait for the detached alert
// threads before the process exits
class DrainingNotifier : public SecretNotifier {
public:
    std::expected<void, NotifyErrorInfo> send_high_severity_secret_notification(
        const NotificationContext& ctx, const SecretFinding& finding, const std::string& channel) override
    {
        auto res = console_.send_high_severity_secret_notification(ctx, finding, channel);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delivered_++;
        }
        cv_.notify_all();
        return res;
    }

    bool wait_for(size_t count, std::chrono::seconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return delivered_ >= count; });
    }

private:
    ConsoleNotifier console_;
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t delivered_ = 0;
};

void print_usage(const char* program_name) {
    std::cout << "leakscan - secret detection for fetched content (C++23)\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  scan <file>                  Scan a local file for secrets\n"
              << "  patterns                     List the loaded regex rules\n\n"
              << "Options:\n"
              << "  --config <file>              JSON configuration file\n"
              << "  --url <source>               Source URL recorded on findings (default: file path)\n"
              << "  --content-type <type>        Content type of the scanned data\n";
}

int cmd_scan(const FSMContext& ctx) {
    const std::string& path = ctx.args[0];
    std::ifstream file(path, std::ios::binary);
    if (!file) { std::cerr << "Error: cannot open " << path << "\n"; return 1; }
    std::ostringstream oss;
    oss << file.rdbuf();
    std::string content = oss.str();

    std::shared_ptr<FindingStore> store;
    if (!ctx.config.secrets_store_path.empty()) {
        store = std::make_shared<SecretsStore>(ctx.config.secrets_store_path);
    }
    auto notifier = std::make_shared<DrainingNotifier>();

    auto orchestrator = SecretDetectionOrchestrator::create(ctx.config, store, notifier);
    if (!orchestrator) { std::cerr << "Error: " << orchestrator.error().message << "\n"; return 1; }

    const std::string url = ctx.url.empty() ? path : ctx.url;
    auto result = orchestrator->scan_content(url, content, ctx.content_type);

    size_t alerts = 0;
    for (const auto& f : result.findings) {
        std::cout << to_string(f.severity) << "\t" << f.rule_id << "\t" << f.source_url << ":" << f.line_number
                  << "\t" << mask_secret(f.secret_text) << "\t" << f.tool_name
                  << (f.verification == Verification::Verified ? "\tverified" : "") << "\n";
        if (is_high_or_critical(f.severity)) alerts++;
    }
    std::cout << result.findings.size() << " finding(s)\n";

    if (ctx.config.notify_on_high_severity && alerts > 0 &&
        !notifier->wait_for(alerts, std::chrono::seconds(ctx.config.notification_timeout_seconds))) {
        compact::Log::warn("Main", "not every notification completed before exit");
    }

    if (!result.ok()) {
        std::cerr << "Error: findings were not persisted: " << result.error->message << "\n";
        return 2;
    }
    return 0;
}

int cmd_patterns(const FSMContext& ctx) {
    auto registry = PatternRegistry::create(make_registry_sources(ctx.config));
    if (!registry) { std::cerr << "Error: " << registry.error().message << "\n"; return 1; }
    for (const auto& p : registry->patterns()) {
        std::cout << to_string(p.origin) << "\t" << to_string(p.severity) << "\t" << p.rule_id << "\t"
                  << p.description << "\n";
    }
    std::cout << registry->size() << " rule(s)\n";
    return 0;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                state = FSMState::LoadConfig;
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    if (a == "--config" && i + 1 < ctx.argc) ctx.config_path = ctx.argv[++i];
                    else if (a == "--url" && i + 1 < ctx.argc) ctx.url = ctx.argv[++i];
                    else if (a == "--content-type" && i + 1 < ctx.argc) ctx.content_type = ctx.argv[++i];
                    else if (a.starts_with("--")) {
                        ctx.exit_code = 1;
                        ctx.error_message = "Unknown or incomplete option: " + a;
                        state = FSMState::Error;
                        break;
                    }
                    else ctx.args.push_back(a);
                }
                if (state == FSMState::Error) break;

                if (ctx.cmd == "scan") {
                    if (ctx.args.size() != 1) {
                        ctx.exit_code = 1;
                        ctx.error_message = "scan requires exactly one <file> argument.";
                        state = FSMState::Error;
                    }
                } else if (ctx.cmd == "patterns") {
                    if (!ctx.args.empty()) {
                        ctx.exit_code = 1;
                        ctx.error_message = "patterns takes no arguments.";
                        state = FSMState::Error;
                    }
                } else {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                }
                break;
            }
            case FSMState::LoadConfig: {
                if (!ctx.config_path.empty()) {
                    auto cfg = load_secrets_config(ctx.config_path);
                    if (!cfg) {
                        ctx.exit_code = 1;
                        ctx.error_message = cfg.error().message;
                        state = FSMState::Error;
                        break;
                    }
                    ctx.config = std::move(*cfg);
                }
                if (auto ok = validate(ctx.config); !ok) {
                    ctx.exit_code = 1;
                    ctx.error_message = ok.error().message;
                    state = FSMState::Error;
                    break;
                }
                if (auto level = compact::parse_level(ctx.config.log_level)) compact::Log::set_level(*level);
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                if (ctx.cmd == "scan") {
                    ctx.exit_code = cmd_scan(ctx);
                    ctx.result_message = "scan finished";
                } else {
                    ctx.exit_code = cmd_patterns(ctx);
                    ctx.result_message = "patterns listed";
                }
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand: {
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - ctx.start_time).count();
                compact::Log::debug("Main", ctx.result_message + " in " + std::to_string(ms) + " ms");
                state = FSMState::Done;
                break;
            }
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
