/*
 * scriptdeck C++ - Sandbox Supervisor Implementation
 *
 * fork + execve of the worker with an empty environment. Between fork and
 * execve the child only makes async-signal-safe calls: everything it
 * needs (argv, envp, descriptor numbers) is prepared beforehand, so this
 * is safe from a multi-threaded caller.
 */
#include <scriptdeck/sandbox/supervisor.hpp>
#include <scriptdeck/sandbox/channel.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <chrono>
#include <vector>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <climits>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <sys/syscall.h>

namespace scriptdeck {

const char* state_name(SupervisorState state) {
    switch (state) {
        case SupervisorState::IDLE: return "IDLE";
        case SupervisorState::SPAWNING: return "SPAWNING";
        case SupervisorState::RUNNING: return "RUNNING";
        case SupervisorState::COMPLETED: return "COMPLETED";
        case SupervisorState::TIMED_OUT: return "TIMED_OUT";
        case SupervisorState::CRASHED_WITHOUT_RESULT: return "CRASHED_WITHOUT_RESULT";
        case SupervisorState::SPAWN_FAILED: return "SPAWN_FAILED";
    }
    return "UNKNOWN";
}

namespace {

typedef std::chrono::steady_clock Clock;

const int POLL_SLICE_MS = 50;
const int MAX_READS_PER_WAKEUP = 16;
const int WORKER_CHANNEL_FD = 3;

// Slack above the worker's own output budget before the supervisor starts
// discarding (truncation marker, final traceback)
const size_t OUTPUT_SLACK_BYTES = 64 * 1024;

int remaining_ms(Clock::time_point deadline) {
    int64_t left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left < 0 ? 0 : static_cast<int>(left);
}

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string describe_exit(int status) {
    char buf[160];
    if (WIFEXITED(status)) {
        snprintf(buf, sizeof(buf), "Worker exited with status %d", WEXITSTATUS(status));
    } else if (WIFSIGNALED(status)) {
        snprintf(buf, sizeof(buf), "Worker terminated by signal %d (%s)",
                 WTERMSIG(status), strsignal(WTERMSIG(status)));
    } else {
        snprintf(buf, sizeof(buf), "Worker ended with status 0x%x", status);
    }
    return std::string(buf);
}

ExecutionOutcome outcome_for(SupervisorState state) {
    switch (state) {
        case SupervisorState::TIMED_OUT: return ExecutionOutcome::TIMED_OUT;
        case SupervisorState::CRASHED_WITHOUT_RESULT: return ExecutionOutcome::CRASHED_WITHOUT_RESULT;
        case SupervisorState::SPAWN_FAILED: return ExecutionOutcome::SPAWN_FAILED;
        default: return ExecutionOutcome::COMPLETED;
    }
}

// Runs in the forked child. Async-signal-safe calls only.
[[noreturn]] void exec_worker(const char* path, char* const argv[], char* const envp[],
                              int request_fd, int channel_fd, int max_fd) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, NULL);
    
    // Park everything above the target numbers before moving it into place
    int req = fcntl(request_fd, F_DUPFD, 10);
    int chan = fcntl(channel_fd, F_DUPFD, 10);
    int devnull = open("/dev/null", O_WRONLY);
    int nul = devnull >= 0 ? fcntl(devnull, F_DUPFD, 10) : -1;
    if (req < 0 || chan < 0 || nul < 0) _exit(126);
    
    if (dup2(req, STDIN_FILENO) < 0 ||
        dup2(nul, STDOUT_FILENO) < 0 ||
        dup2(chan, WORKER_CHANNEL_FD) < 0) {
        _exit(126);
    }
    
#ifdef SYS_close_range
    if (syscall(SYS_close_range, WORKER_CHANNEL_FD + 1, ~0U, 0) != 0)
#endif
    {
        for (int fd = WORKER_CHANNEL_FD + 1; fd < max_fd; ++fd) {
            close(fd);
        }
    }
    
    // Do not leak the caller's working directory into the script
    if (chdir("/") != 0) _exit(126);
    
    execve(path, argv, envp);
    _exit(127);
}

// One worker process: its pipes, its decoded output, its exit status
class WorkerRun {
public:
    WorkerRun(const SupervisorConfig& config)
        : config_(config)
        , pid_(-1)
        , request_fd_(-1)
        , channel_fd_(-1)
        , written_(0)
        , channel_eof_(false)
        , reaped_(false)
        , status_known_(false)
        , status_(0)
        , got_result_(false)
        , output_dropped_(false)
        , output_cap_(config.limits.max_output_bytes + OUTPUT_SLACK_BYTES)
        , state_(SupervisorState::IDLE) {}
    
    ~WorkerRun() {
        close_fd(request_fd_);
        close_fd(channel_fd_);
        if (pid_ > 0 && !reaped_) {
            kill_group();
            reap();
        }
    }
    
    pid_t pid() const { return pid_; }
    SupervisorState state() const { return state_; }
    
    bool spawn(const std::string& payload, std::string& error);
    SupervisorState supervise(Clock::time_point deadline);
    ExecutionResult build_result(SupervisorState state, double elapsed, int timeout_seconds) const;
    
private:
    SupervisorState transition(SupervisorState next);
    bool try_spawn(const std::string& payload, std::string& error);
    bool child_exited();
    void kill_group();
    void reap();
    void finish(Clock::time_point grace_deadline);
    void pump_request();
    void read_channel();
    void drain_channel(Clock::time_point deadline);
    void handle_frame(const Frame& frame);
    void append_output(std::string& target, const std::string& text);
    
    const SupervisorConfig& config_;
    pid_t pid_;
    int request_fd_;
    int channel_fd_;
    std::string payload_;
    size_t written_;
    bool channel_eof_;
    bool reaped_;
    bool status_known_;
    int status_;
    
    ChannelDecoder decoder_;
    std::string stdout_;
    std::string stderr_;
    bool got_result_;
    bool output_dropped_;
    size_t output_cap_;
    WorkerReport report_;
    SupervisorState state_;
};

SupervisorState WorkerRun::transition(SupervisorState next) {
    LOG_DEBUG("[Supervisor] Worker %d: %s -> %s", pid_, state_name(state_), state_name(next));
    state_ = next;
    return next;
}

bool WorkerRun::spawn(const std::string& payload, std::string& error) {
    transition(SupervisorState::SPAWNING);
    if (!try_spawn(payload, error)) {
        transition(SupervisorState::SPAWN_FAILED);
        return false;
    }
    transition(SupervisorState::RUNNING);
    return true;
}

bool WorkerRun::try_spawn(const std::string& payload, std::string& error) {
    if (access(config_.worker_path.c_str(), X_OK) != 0) {
        error = "Worker executable not available: " + config_.worker_path +
                " (" + strerror(errno) + ")";
        return false;
    }
    
    int request_pipe[2];
    int channel_pipe[2];
    if (pipe2(request_pipe, O_CLOEXEC) != 0) {
        error = std::string("Failed to create request pipe: ") + strerror(errno);
        return false;
    }
    if (pipe2(channel_pipe, O_CLOEXEC) != 0) {
        error = std::string("Failed to create result channel: ") + strerror(errno);
        close(request_pipe[0]);
        close(request_pipe[1]);
        return false;
    }
    
    // Everything the child touches is built before fork
    std::string channel_arg = std::to_string(WORKER_CHANNEL_FD);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(config_.worker_path.c_str()));
    argv.push_back(const_cast<char*>("--channel-fd"));
    argv.push_back(const_cast<char*>(channel_arg.c_str()));
    argv.push_back(const_cast<char*>("--log-level"));
    argv.push_back(const_cast<char*>(config_.worker_log_level.c_str()));
    argv.push_back(NULL);
    char* envp[] = {NULL};
    
    long open_max = sysconf(_SC_OPEN_MAX);
    int max_fd = (open_max <= 0 || open_max > 65536) ? 65536 : static_cast<int>(open_max);
    
    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Failed to fork worker: ") + strerror(errno);
        close(request_pipe[0]);
        close(request_pipe[1]);
        close(channel_pipe[0]);
        close(channel_pipe[1]);
        return false;
    }
    
    if (pid == 0) {
        exec_worker(config_.worker_path.c_str(), &argv[0], envp,
                    request_pipe[0], channel_pipe[1], max_fd);
    }
    
    pid_ = pid;
    
    // Mirror the child's setpgid so the group exists before we ever signal it
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LOG_DEBUG("[Supervisor] setpgid(%d) failed: %s", pid, strerror(errno));
    }
    
    close(request_pipe[0]);
    close(channel_pipe[1]);
    request_fd_ = request_pipe[1];
    channel_fd_ = channel_pipe[0];
    payload_ = payload;
    
    if (!set_nonblocking(request_fd_) || !set_nonblocking(channel_fd_)) {
        error = std::string("Failed to configure worker pipes: ") + strerror(errno);
        return false;
    }
    return true;
}

// Exited but not yet reaped: the pid (and so the group id) stays reserved
bool WorkerRun::child_exited() {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) return false;
        LOG_WARN("[Supervisor] waitid(%d) failed: %s", pid_, strerror(errno));
        return true;
    }
    return info.si_pid == pid_;
}

void WorkerRun::kill_group() {
    if (killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("[Supervisor] killpg(%d) failed: %s", pid_, strerror(errno));
    }
}

void WorkerRun::reap() {
    while (waitpid(pid_, &status_, 0) < 0) {
        if (errno == EINTR) continue;
        LOG_WARN("[Supervisor] waitpid(%d) failed: %s", pid_, strerror(errno));
        reaped_ = true;
        return;
    }
    status_known_ = true;
    reaped_ = true;
}

void WorkerRun::finish(Clock::time_point grace_deadline) {
    close_fd(request_fd_);
    kill_group();
    reap();
    drain_channel(grace_deadline);
}

SupervisorState WorkerRun::supervise(Clock::time_point deadline) {
    for (;;) {
        if (child_exited()) {
            finish(Clock::now() + std::chrono::milliseconds(config_.grace_ms));
            return transition(got_result_ ? SupervisorState::COMPLETED
                                          : SupervisorState::CRASHED_WITHOUT_RESULT);
        }
        
        int left = remaining_ms(deadline);
        if (left <= 0) {
            finish(Clock::now() + std::chrono::milliseconds(config_.grace_ms));
            if (got_result_) {
                LOG_WARN("[Supervisor] Worker %d reported but did not exit in time", pid_);
                return transition(SupervisorState::COMPLETED);
            }
            return transition(SupervisorState::TIMED_OUT);
        }
        
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int channel_idx = -1;
        int request_idx = -1;
        if (!channel_eof_) {
            fds[nfds].fd = channel_fd_;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            channel_idx = static_cast<int>(nfds++);
        }
        if (request_fd_ >= 0) {
            fds[nfds].fd = request_fd_;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            request_idx = static_cast<int>(nfds++);
        }
        
        int rc = poll(fds, nfds, left < POLL_SLICE_MS ? left : POLL_SLICE_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Supervisor] poll failed: %s", strerror(errno));
            finish(Clock::now() + std::chrono::milliseconds(config_.grace_ms));
            return transition(got_result_ ? SupervisorState::COMPLETED
                                          : SupervisorState::CRASHED_WITHOUT_RESULT);
        }
        if (rc == 0) continue;
        
        if (request_idx >= 0 && fds[request_idx].revents != 0) {
            pump_request();
        }
        if (channel_idx >= 0 && fds[channel_idx].revents != 0) {
            read_channel();
        }
    }
}

void WorkerRun::pump_request() {
    while (written_ < payload_.size()) {
        ssize_t n = write(request_fd_, payload_.data() + written_, payload_.size() - written_);
        if (n > 0) {
            written_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        
        LOG_DEBUG("[Supervisor] Worker %d stopped reading its request: %s",
                  pid_, strerror(errno));
        break;
    }
    // EOF tells the worker the request is complete
    close_fd(request_fd_);
}

void WorkerRun::read_channel() {
    char buf[65536];
    for (int i = 0; i < MAX_READS_PER_WAKEUP; ++i) {
        ssize_t n = read(channel_fd_, buf, sizeof(buf));
        if (n > 0) {
            decoder_.feed(buf, static_cast<size_t>(n));
            Frame frame;
            while (decoder_.next(frame)) {
                handle_frame(frame);
            }
            continue;
        }
        if (n == 0) {
            channel_eof_ = true;
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        
        LOG_WARN("[Supervisor] Reading result channel failed: %s", strerror(errno));
        channel_eof_ = true;
        return;
    }
}

void WorkerRun::drain_channel(Clock::time_point deadline) {
    while (!channel_eof_) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            LOG_WARN("[Supervisor] Result channel of worker %d still open after kill", pid_);
            return;
        }
        
        struct pollfd pfd;
        pfd.fd = channel_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, left < POLL_SLICE_MS ? left : POLL_SLICE_MS);
        if (rc < 0 && errno != EINTR) {
            LOG_WARN("[Supervisor] poll failed while draining: %s", strerror(errno));
            return;
        }
        if (rc > 0) {
            read_channel();
        }
    }
}

void WorkerRun::handle_frame(const Frame& frame) {
    // Nothing after the terminal record counts
    if (got_result_) return;
    
    switch (frame.type) {
        case FrameType::STDOUT:
            append_output(stdout_, frame.payload);
            break;
        case FrameType::STDERR:
            append_output(stderr_, frame.payload);
            break;
        case FrameType::RESULT: {
            Json j = Json::parse(frame.payload, nullptr, false);
            std::string error;
            if (j.is_discarded() || !WorkerReport::from_json(j, report_, error)) {
                LOG_WARN("[Supervisor] Worker %d sent a malformed result record%s%s",
                         pid_, error.empty() ? "" : ": ", error.c_str());
                return;
            }
            got_result_ = true;
            break;
        }
    }
}

void WorkerRun::append_output(std::string& target, const std::string& text) {
    if (output_dropped_) return;
    
    size_t used = stdout_.size() + stderr_.size();
    if (used + text.size() <= output_cap_) {
        target += text;
        return;
    }
    
    LOG_WARN("[Supervisor] Worker %d exceeded the output budget, discarding the rest", pid_);
    target += truncate_safe(text, output_cap_ - used);
    target += OUTPUT_TRUNCATED_MARKER;
    output_dropped_ = true;
}

ExecutionResult WorkerRun::build_result(SupervisorState state, double elapsed,
                                        int timeout_seconds) const {
    ExecutionResult result;
    result.stdout_text = stdout_;
    result.stderr_text = stderr_;
    result.outcome = outcome_for(state);
    result.elapsed_seconds = elapsed;
    
    switch (state) {
        case SupervisorState::COMPLETED:
            result.succeeded = report_.success;
            if (report_.success) {
                result.has_return_value = report_.has_return_value;
                result.return_value = report_.has_return_value ? report_.return_value : Json(nullptr);
            } else {
                result.error_message = report_.error.empty() ? "Unknown error" : report_.error;
            }
            break;
            
        case SupervisorState::TIMED_OUT:
            result.succeeded = false;
            result.error_message = TIMEOUT_MESSAGE;
            result.stderr_text += "\n";
            result.stderr_text += TIMEOUT_MESSAGE;
            result.elapsed_seconds = static_cast<double>(timeout_seconds);
            break;
            
        default: {
            result.succeeded = false;
            result.error_message = NO_RESULT_MESSAGE;
            if (!result.stderr_text.empty() && result.stderr_text[result.stderr_text.size() - 1] != '\n') {
                result.stderr_text += "\n";
            }
            result.stderr_text += status_known_ ? describe_exit(status_) : "Worker exit status unknown";
            if (decoder_.corrupt()) {
                result.stderr_text += " (result channel corrupted)";
            }
            result.stderr_text += "\n";
            break;
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// SupervisorConfig
// ============================================================================

SupervisorConfig SupervisorConfig::from_config(const Config& cfg) {
    SupervisorConfig c;
    c.worker_path = expand_home(cfg.get_string("sandbox.worker_path",
                                               join_path(executable_dir(), "scriptdeck-worker")));
    // The worker is exec'd after changing into "/"
    if (!c.worker_path.empty() && c.worker_path[0] != '/') {
        char cwd[PATH_MAX];
        if (getcwd(cwd, sizeof(cwd)) != NULL) {
            c.worker_path = join_path(cwd, c.worker_path);
        }
    }
    c.worker_log_level = cfg.get_string("sandbox.worker_log_level", c.worker_log_level);
    c.default_timeout_seconds = static_cast<int>(
        cfg.get_int("sandbox.default_timeout", c.default_timeout_seconds));
    c.max_timeout_seconds = static_cast<int>(
        cfg.get_int("sandbox.max_timeout", c.max_timeout_seconds));
    c.grace_ms = static_cast<int>(cfg.get_int("sandbox.grace_ms", c.grace_ms));
    c.limits.max_output_bytes = static_cast<size_t>(
        cfg.get_int("sandbox.max_output_bytes", static_cast<int64_t>(c.limits.max_output_bytes)));
    c.limits.memory_limit_mb = cfg.get_int("sandbox.memory_limit_mb", c.limits.memory_limit_mb);
    c.limits.max_open_files = static_cast<int>(
        cfg.get_int("sandbox.max_open_files", c.limits.max_open_files));
    
    if (c.default_timeout_seconds <= 0) {
        LOG_WARN("[Supervisor] sandbox.default_timeout must be positive, using 30");
        c.default_timeout_seconds = 30;
    }
    if (c.max_timeout_seconds < c.default_timeout_seconds) {
        LOG_WARN("[Supervisor] sandbox.max_timeout below the default timeout, raising it to %d",
                 c.default_timeout_seconds);
        c.max_timeout_seconds = c.default_timeout_seconds;
    }
    if (c.grace_ms < 0) c.grace_ms = 0;
    return c;
}

// ============================================================================
// SandboxSupervisor
// ============================================================================

SandboxSupervisor::SandboxSupervisor(const SupervisorConfig& config)
    : config_(config)
{
    // A dead worker must surface as EPIPE on the request pipe
    signal(SIGPIPE, SIG_IGN);
}

int SandboxSupervisor::effective_timeout(int requested_seconds) const {
    if (requested_seconds <= 0) return config_.default_timeout_seconds;
    return clamp(requested_seconds, 1, config_.max_timeout_seconds);
}

ExecutionResult SandboxSupervisor::execute(const std::string& source,
                                           const std::string& stdin_text,
                                           int timeout_seconds) const {
    return execute(ExecutionRequest(source, stdin_text, timeout_seconds));
}

ExecutionResult SandboxSupervisor::execute(const ExecutionRequest& request) const {
    int timeout = effective_timeout(request.timeout_seconds);
    
    WorkerRequest worker_request;
    worker_request.source_text = request.source_text;
    worker_request.stdin_text = request.stdin_text;
    worker_request.entry_point = ENTRY_POINT_NAME;
    worker_request.limits = config_.limits;
    worker_request.limits.cpu_seconds = timeout + 1;
    std::string payload = worker_request.to_json().dump(-1, ' ', false,
                                                        Json::error_handler_t::replace);
    
    Clock::time_point start = Clock::now();
    WorkerRun run(config_);
    
    std::string error;
    if (!run.spawn(payload, error)) {
        LOG_ERROR("[Supervisor] %s", error.c_str());
        ExecutionResult failed = ExecutionResult::failure(ExecutionOutcome::SPAWN_FAILED, error);
        failed.elapsed_seconds = seconds_since(start);
        return failed;
    }
    LOG_DEBUG("[Supervisor] Worker %d started (timeout %ds)", run.pid(), timeout);
    
    SupervisorState state = run.supervise(start + std::chrono::seconds(timeout));
    ExecutionResult result = run.build_result(state, seconds_since(start), timeout);
    
    if (state == SupervisorState::COMPLETED) {
        LOG_DEBUG("[Supervisor] Worker %d %s: success=%s (%.3fs)", run.pid(), state_name(state),
                  result.succeeded ? "true" : "false", result.elapsed_seconds);
    } else {
        LOG_WARN("[Supervisor] Worker %d %s after %.3fs", run.pid(), state_name(state),
                 seconds_since(start));
    }
    return result;
}

} // namespace scriptdeck
