#include "process_runner.hpp"
#include "compact_log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <array>
#include <thread>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "ProcessRunner";
constexpr size_t kStderrTailBytes = 4096;
constexpr int kPollSliceMs = 50;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

std::expected<Pipe, ProcessErrorInfo> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(ProcessErrorInfo{ProcessError::PipeFailed,
                                                std::string("pipe2: ") + std::strerror(errno)});
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void reap_blocking(pid_t pid) {
    while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

// SIGKILL the whole group, then reap the direct child
void kill_tree(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        ::kill(pid, SIGKILL);
    }
    reap_blocking(pid);
}

bool drain(int fd, std::string& out, bool tail_only) {
    std::array<char, 65536> buf;
    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            out.append(buf.data(), static_cast<size_t>(n));
            if (tail_only && out.size() > kStderrTailBytes) {
                out.erase(0, out.size() - kStderrTailBytes);
            }
            continue;
        }
        if (n == 0) return false;  // EOF
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

std::expected<ProcessResult, ProcessErrorInfo> PosixProcessRunner::run(
    const ProcessSpec& spec,
    std::stop_token stop) const
{
    auto out = make_pipe();
    if (!out) return std::unexpected(out.error());
    auto err = make_pipe();
    if (!err) return std::unexpected(err.error());
    auto status_pipe = make_pipe();
    if (!status_pipe) return std::unexpected(status_pipe.error());

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.binary.c_str()));
    for (const auto& arg : spec.args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(ProcessErrorInfo{ProcessError::SpawnFailed,
                                                std::string("fork: ") + std::strerror(errno)});
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out->write_end.get(), STDOUT_FILENO);
        ::dup2(err->write_end.get(), STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int code = errno;
        ssize_t ignored = ::write(status_pipe->write_end.get(), &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    // Both sides call setpgid so the group exists before we might kill it
    ::setpgid(pid, pid);
    out->write_end.reset();
    err->write_end.reset();
    status_pipe->write_end.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe->read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap_blocking(pid);
        return std::unexpected(ProcessErrorInfo{ProcessError::SpawnFailed,
                                                "exec " + spec.binary + ": " + std::strerror(exec_errno)});
    }

    ::fcntl(out->read_end.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(err->read_end.get(), F_SETFL, O_NONBLOCK);

    const bool has_deadline = spec.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    auto expired = [&] {
        return has_deadline && std::chrono::steady_clock::now() >= deadline;
    };
    auto abort_run = [&]() -> std::unexpected<ProcessErrorInfo> {
        kill_tree(pid);
        if (stop.stop_requested()) {
            return std::unexpected(ProcessErrorInfo{ProcessError::Cancelled, spec.binary + " cancelled"});
        }
        return std::unexpected(ProcessErrorInfo{
            ProcessError::Timeout,
            spec.binary + " exceeded " + std::to_string(spec.timeout.count()) + " ms"
        });
    };

    ProcessResult result;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (stop.stop_requested() || expired()) return abort_run();

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_open) fds[count++] = pollfd{out->read_end.get(), POLLIN, 0};
        if (err_open) fds[count++] = pollfd{err->read_end.get(), POLLIN, 0};

        int rc = ::poll(fds.data(), count, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            kill_tree(pid);
            return std::unexpected(ProcessErrorInfo{ProcessError::WaitFailed,
                                                    std::string("poll: ") + std::strerror(errno)});
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out->read_end.get()) {
                out_open = drain(fds[i].fd, result.stdout_data, false);
            } else {
                err_open = drain(fds[i].fd, result.stderr_tail, true);
            }
        }
    }

    // Output is closed; the child may still linger, so the deadline keeps applying
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            ::kill(-pid, SIGKILL);
            return std::unexpected(ProcessErrorInfo{ProcessError::WaitFailed,
                                                    std::string("waitpid: ") + std::strerror(errno)});
        }
        if (stop.stop_requested() || expired()) return abort_run();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    // Reap anything the tool left behind in its group
    ::kill(-pid, SIGKILL);

    result.exit_code = decode_status(status);
    compact::Log::debug(kTag, spec.binary + " exited with " + std::to_string(result.exit_code) + ", " +
                              std::to_string(result.stdout_data.size()) + " bytes of output");
    return result;
}

} // namespace leakscan
