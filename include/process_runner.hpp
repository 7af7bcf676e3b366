#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <expected>
#include <stop_token>

namespace leakscan {

struct ProcessSpec {
    std::string binary;                 // resolved through PATH when it has no '/'
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{0};  // 0 = no deadline
};

struct ProcessResult {
    int exit_code = 0;         // 128 + signal when the child was killed by a signal
    std::string stdout_data;
    std::string stderr_tail;   // last few KB only
};

enum class ProcessError {
    PipeFailed,
    SpawnFailed,
    Timeout,
    Cancelled,
    WaitFailed
};

struct ProcessErrorInfo {
    ProcessError error;
    std::string message;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs to completion, deadline or cancellation. On Timeout/Cancelled the
    // child and everything it spawned are gone and no output is returned.
    virtual std::expected<ProcessResult, ProcessErrorInfo> run(
        const ProcessSpec& spec,
        std::stop_token stop = {}
    ) const = 0;
};

// fork/execvp runner. The child leads its own process group so the whole
// tree can be SIGKILLed when the deadline passes.
class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<ProcessResult, ProcessErrorInfo> run(
        const ProcessSpec& spec,
        std::stop_token stop = {}
    ) const override;
};

} // namespace leakscan
