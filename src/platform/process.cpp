#include "fcorr/process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace fcorr {

namespace stdfs = std::filesystem;

namespace {

constexpr long long kPollSliceMs = 50;
constexpr long long kTerminateGraceMs = 500;
constexpr long long kDrainAfterExitMs = 200;

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) out += " ";
        bool needs_quotes = argv[i].find(' ') != std::string::npos;
        if (needs_quotes) out += "\"";
        out += argv[i];
        if (needs_quotes) out += "\"";
    }
    return out;
}

#ifndef _WIN32

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Read whatever is available on a non-blocking fd. Returns false on EOF/error.
bool drain_fd(int fd, std::string& sink, std::size_t limit, bool& truncated) {
    char buf[65536];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::size_t room = sink.size() < limit ? limit - sink.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            sink.append(buf, take);
            if (take < static_cast<std::size_t>(n)) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

#endif // !_WIN32

} // namespace

std::string ProcessResult::combined_output() const {
    if (stderr_text.empty()) return stdout_text;
    if (stdout_text.empty()) return stderr_text;
    std::string out = stdout_text;
    if (out.back() != '\n') out += '\n';
    out += stderr_text;
    return out;
}

std::string find_executable(const std::string& name, const std::string& path_env) {
    if (name.empty()) return "";

#ifndef _WIN32
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : "";
    }

    size_t start = 0;
    while (start <= path_env.size()) {
        size_t end = path_env.find(':', start);
        if (end == std::string::npos) end = path_env.size();
        std::string dir = path_env.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        std::error_code ec;
        if (stdfs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
#else
    (void)path_env;
#endif
    return "";
}

// ============================================================================
// ProcessHandle
// ============================================================================

ProcessHandle::~ProcessHandle() {
    terminate();
    close_pipes();
}

void ProcessHandle::close_pipes() {
#ifndef _WIN32
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
#endif
}

#ifndef _WIN32

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const ProcessSpec& spec, std::string& error) {
    if (spec.argv.empty()) {
        error = "empty command";
        return nullptr;
    }

    std::error_code ec;
    if (!spec.cwd.empty() && !stdfs::is_directory(spec.cwd, ec)) {
        error = "working directory does not exist: " + spec.cwd;
        return nullptr;
    }

    auto env_map = current_environment();
    for (const auto& [key, value] : spec.env) {
        env_map[key] = value;
    }

    // Relative paths with a slash are relative to the child's cwd
    std::string program = spec.argv[0];
    if (program.find('/') != std::string::npos && program[0] != '/' && !spec.cwd.empty()) {
        program = (stdfs::path(spec.cwd) / program).string();
    }
    std::string exe = find_executable(program, env_map["PATH"]);
    if (exe.empty()) {
        error = "executable not found: " + spec.argv[0];
        return nullptr;
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& [key, value] : env_map) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::vector<std::string> argv_strings = spec.argv;
    std::vector<char*> argv;
    for (auto& s : argv_strings) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0 || ::pipe(exec_pipe) != 0) {
        error = "pipe failed: " + std::string(std::strerror(errno));
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            if (fd >= 0) ::close(fd);
        }
        return nullptr;
    }
    set_cloexec(out_pipe[0]);
    set_cloexec(err_pipe[0]);
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    pid_t pid = ::fork();
    if (pid == -1) {
        error = "fork failed: " + std::string(std::strerror(errno));
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            ::close(fd);
        }
        return nullptr;
    }

    if (pid == 0) {
        // Child: own process group so the whole tree can be signalled
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);

        if (cwd && ::chdir(cwd) != 0) {
            int err = errno;
            ssize_t wr = ::write(exec_pipe[1], &err, sizeof(err));
            (void)wr;
            ::_exit(127);
        }

        ::execve(exe.c_str(), argv.data(), envp.data());

        int err = errno;
        ssize_t wr = ::write(exec_pipe[1], &err, sizeof(err));
        (void)wr;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);  // mirror the child's setpgid (race safety)
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // exec_pipe closes on successful exec (CLOEXEC); otherwise it carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        error = "failed to execute '" + spec.argv[0] + "': " + std::strerror(child_errno);
        return nullptr;
    }

    auto handle = std::make_unique<ProcessHandle>(Key{});
    handle->pid_ = pid;
    handle->stdout_fd_ = out_pipe[0];
    handle->stderr_fd_ = err_pipe[0];
    handle->reaped_ = false;
    handle->timeout_ms_ = spec.timeout_ms;
    handle->max_output_bytes_ = spec.max_output_bytes;
    handle->started_ = std::chrono::steady_clock::now();
    set_nonblocking(handle->stdout_fd_);
    set_nonblocking(handle->stderr_fd_);

    spdlog::debug("spawned pid {} in {}: {}", pid, spec.cwd.empty() ? "." : spec.cwd,
                  join_argv(spec.argv));
    return handle;
}

// Returns true once the leader has exited. With block == false the zombie is
// left in place (WNOWAIT) so its pgid stays reserved until the group is killed.
bool ProcessHandle::reap(bool block) {
    if (reaped_) return true;

    if (!block) {
        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        int rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
        return rc == 0 && info.si_pid == pid_;
    }

    // Take down stragglers of the group before the leader's pgid is released
    ::killpg(pid_, SIGKILL);
    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid_, &status, 0);
    } while (w == -1 && errno == EINTR);
    status_ = status;
    reaped_ = true;
    return true;
}

void ProcessHandle::terminate() {
    if (reaped_) return;

    ::killpg(pid_, SIGTERM);
    auto start = std::chrono::steady_clock::now();
    while (!reap(false) && elapsed_ms(start) < kTerminateGraceMs) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    reap(true);  // SIGKILLs whatever survived
}

ProcessResult ProcessHandle::wait(const CancellationToken* cancel) {
    ProcessResult result;
    result.launched = true;

    bool exited = false;
    std::chrono::steady_clock::time_point exited_at;

    while (true) {
        std::vector<pollfd> fds;
        if (stdout_fd_ >= 0) fds.push_back({stdout_fd_, POLLIN, 0});
        if (stderr_fd_ >= 0) fds.push_back({stderr_fd_, POLLIN, 0});

        if (!fds.empty()) {
            int rc = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), static_cast<int>(kPollSliceMs));
            if (rc < 0 && errno != EINTR) {
                result.error = "poll failed: " + std::string(std::strerror(errno));
                break;
            }
            for (const auto& p : fds) {
                if (p.revents == 0) continue;
                int& fd = p.fd == stdout_fd_ ? stdout_fd_ : stderr_fd_;
                std::string& sink = p.fd == stdout_fd_ ? result.stdout_text : result.stderr_text;
                if (!drain_fd(fd, sink, max_output_bytes_, result.output_truncated)) {
                    close_fd(fd);
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs));
        }

        if (!exited && reap(false)) {
            exited = true;
            exited_at = std::chrono::steady_clock::now();
        }

        if (exited) {
            // Descendants may keep the pipes open; give them a short window
            if ((stdout_fd_ < 0 && stderr_fd_ < 0) || elapsed_ms(exited_at) >= kDrainAfterExitMs) {
                break;
            }
            continue;
        }

        if (cancel && cancel->is_cancelled()) {
            result.cancelled = true;
            spdlog::debug("pid {} cancelled", pid_);
            break;
        }
        if (timeout_ms_ > 0 && elapsed_ms(started_) >= timeout_ms_) {
            result.timed_out = true;
            spdlog::warn("pid {} timed out after {} ms", pid_, timeout_ms_);
            break;
        }
    }

    if (!exited) {
        terminate();
    } else {
        reap(true);
    }

    // Pick up anything written before the group went down
    if (stdout_fd_ >= 0) drain_fd(stdout_fd_, result.stdout_text, max_output_bytes_, result.output_truncated);
    if (stderr_fd_ >= 0) drain_fd(stderr_fd_, result.stderr_text, max_output_bytes_, result.output_truncated);
    close_pipes();

    if (WIFEXITED(status_)) {
        result.exit_code = WEXITSTATUS(status_);
    } else if (WIFSIGNALED(status_)) {
        result.exit_code = 128 + WTERMSIG(status_);
    }
    result.duration_ms = elapsed_ms(started_);
    return result;
}

#else // _WIN32

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const ProcessSpec& spec, std::string& error) {
    (void)spec;
    error = "process execution is not supported on this platform";
    return nullptr;
}

bool ProcessHandle::reap(bool) { return true; }

void ProcessHandle::terminate() {}

ProcessResult ProcessHandle::wait(const CancellationToken*) {
    ProcessResult result;
    result.error = "process execution is not supported on this platform";
    return result;
}

#endif // _WIN32

// ============================================================================
// run_process
// ============================================================================

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) {
        ProcessResult result;
        result.cancelled = true;
        result.error = "cancelled before start";
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    std::string error;
    auto handle = ProcessHandle::spawn(spec, error);
    if (!handle) {
        ProcessResult result;
        result.error = error;
        result.duration_ms = elapsed_ms(start);
        spdlog::debug("launch failed: {}", error);
        return result;
    }
    return handle->wait(cancel);
}

} // namespace fcorr
