#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    output_fd_ = other.output_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.output_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_output();
        pid_ = other.pid_;
        output_fd_ = other.output_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.output_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void ProcessHandle::close_output() {
    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        while (waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        record_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
}

bool ProcessHandle::read_output(std::string& out, int timeout_ms) {
    if (output_fd_ < 0) return false;

    struct pollfd pfd;
    pfd.fd = output_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return true;
        close_output();
        return false;
    }
    if (ret == 0) return true;

    char buf[4096];
    while (true) {
        ssize_t n = read(output_fd_, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        if (n < 0 && errno == EINTR) continue;
        // 0 = EOF, anything else is a broken pipe
        close_output();
        return false;
    }
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (!running()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        record_status(status);
    }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args) {
    ProcessHandle handle;

    int fds[2];
    if (pipe(fds) != 0) return handle;

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        close(fds[0]);
        close(fds[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        } else {
            close(STDIN_FILENO);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execv(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(fds[1]);
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    int flags = fcntl(fds[0], F_GETFL, 0);
    fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

    handle.pid_ = pid;
    handle.output_fd_ = fds[0];
    return handle;
}

ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::function<bool()>& should_stop) {
    ProcessOutput result;

    ProcessHandle proc = spawn_captured(program, args);
    if (!proc.valid()) return result;
    result.spawned = true;

    while (proc.read_output(result.output, 50)) {
        if (should_stop && should_stop()) {
            proc.terminate();
            result.stopped = true;
            result.exit_code = proc.exit_code();
            return result;
        }
    }

    // Output closed; the child is exiting (or detached its output)
    while (proc.running()) {
        if (should_stop && should_stop()) {
            proc.terminate();
            result.stopped = true;
            break;
        }
        sleep_ms(10);
    }
    result.exit_code = proc.exit_code();
    return result;
}

// ── PATH lookup ──────────────────────────────────────────────

static bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_in_path(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return fs::path(name);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable(candidate)) return candidate;
    }
    return std::nullopt;
}

} // namespace platform
