#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace fcorr {

// ============================================================================
// Cancellation
// ============================================================================

// Shared flag polled by running processes. Cancelling terminates whatever
// process group is currently waited on.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Process Specification / Result
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;              // argv[0] resolved against PATH
    std::string cwd;
    std::map<std::string, std::string> env;     // merged over the parent environment
    long long timeout_ms = 300000;              // <= 0 means no limit
    std::size_t max_output_bytes = 32u * 1024u * 1024u;  // per stream
};

struct ProcessResult {
    bool launched = false;          // false: nothing ran, see error
    int exit_code = -1;             // 128 + signal when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    long long duration_ms = 0;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string error;

    std::string combined_output() const;
};

// ============================================================================
// Process Handle
// ============================================================================

/**
 * An in-flight child process tree.
 *
 * The child leads its own process group, so terminate() reaches every
 * descendant. Destroying a handle whose group is still alive terminates it.
 */
class ProcessHandle {
    // Restricts construction to spawn() while keeping make_unique usable
    struct Key {
        explicit Key() = default;
    };

public:
    explicit ProcessHandle(Key) {}
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /**
     * Spawn a process. Returns nullptr and fills error on failure
     * (executable not found, fork/exec failure, bad working directory).
     */
    static std::unique_ptr<ProcessHandle> spawn(const ProcessSpec& spec, std::string& error);

    /**
     * Collect output until the child exits, the deadline passes or the
     * token is cancelled. Called once.
     */
    ProcessResult wait(const CancellationToken* cancel = nullptr);

    // SIGTERM the group, then SIGKILL after a grace period, then reap.
    void terminate();

    bool running() const { return !reaped_; }

private:
    void close_pipes();
    bool reap(bool block);

#ifndef _WIN32
    pid_t pid_ = -1;
#endif
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = true;
    int status_ = 0;
    long long timeout_ms_ = 0;
    std::size_t max_output_bytes_ = 0;
    std::chrono::steady_clock::time_point started_;
};

// ============================================================================
// Convenience API
// ============================================================================

/**
 * Run a command to completion.
 *
 * Never throws and never treats a non-zero exit code as an error. A timeout
 * kills the whole process group and reports timed_out with partial output.
 */
ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel = nullptr);

// Resolve an executable name against a PATH string. Names containing '/'
// are returned as-is when executable.
std::string find_executable(const std::string& name, const std::string& path_env);

} // namespace fcorr
