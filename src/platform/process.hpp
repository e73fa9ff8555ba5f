#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process whose stdout and stderr share one pipe.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps the child once it exits.
    bool running();

    // Wait for the process to exit. Returns exit code, -1 if it was
    // killed by a signal or the wait timed out.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Exit code once the child has been reaped, -1 otherwise.
    int exit_code() const { return exit_code_; }

    // Append any combined stdout/stderr available within timeout_ms to `out`.
    // Returns false once the pipe reaches EOF.
    bool read_output(std::string& out, int timeout_ms);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

private:
    int pid_ = -1;
    int output_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);
    void close_output();

    friend ProcessHandle spawn_captured(const std::string& program,
                                        const std::vector<std::string>& args);
};

// Spawn `program` (a path, not searched on PATH) with stdin from /dev/null
// and stdout+stderr redirected into a pipe read by ProcessHandle::read_output.
ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args);

struct ProcessOutput {
    bool spawned = false;   // fork/pipe succeeded
    bool stopped = false;   // terminated because should_stop() returned true
    int exit_code = -1;
    std::string output;     // stdout and stderr interleaved
};

// Run a child to completion, capturing combined output. `should_stop` is
// polled while the child runs; once it returns true the child is terminated.
ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::function<bool()>& should_stop = nullptr);

// Look up an executable the way execvp would: names containing '/' are
// checked as given, anything else is searched along $PATH.
std::optional<std::filesystem::path> find_in_path(const std::string& name);

} // namespace platform
