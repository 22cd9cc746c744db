#include "vidstore/process.hpp"

#include "vidstore/constants.hpp"
#include "vidstore/env.hpp"
#include "vidstore/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace vidstore::process {

namespace {

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

int OpenStderrCapture() {
    std::string pattern = (std::filesystem::temp_directory_path() / "vidstore-stderr-XXXXXX").string();
    int fd = mkstemp(pattern.data());
    if (fd < 0) {
        throw IoError("cannot create stderr capture file: " + ErrnoText(errno));
    }
    ::unlink(pattern.c_str());
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    return fd;
}

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

}  // namespace

std::chrono::milliseconds DefaultTimeout() {
    std::uint64_t seconds = env::GetUnsigned("VIDSTORE_PROCESS_TIMEOUT", constants::kDefaultProcessTimeoutSec);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::min<std::uint64_t>(seconds, 86400u * 7) * 1000));
}

std::string JoinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

Subprocess::Subprocess(std::vector<std::string> argv, PipeMode mode, std::chrono::milliseconds timeout)
    : argv_(std::move(argv)), command_(JoinArgs(argv_)), mode_(mode), timeout_(timeout) {
    if (argv_.empty()) {
        throw ParameterError("empty command line");
    }
    IgnoreSigpipe();
    stderr_fd_ = OpenStderrCapture();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(stderr_fd_);
        throw ExternalProcessError("pipe failed for " + argv_[0] + ": " + ErrnoText(err));
    }
    const int child_end = mode_ == PipeMode::Stdin ? fds[0] : fds[1];
    pipe_fd_ = mode_ == PipeMode::Stdin ? fds[1] : fds[0];

    SpawnActions actions;
    if (mode_ == PipeMode::Stdin) {
        posix_spawn_file_actions_adddup2(actions.get(), child_end, STDIN_FILENO);
        posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    } else {
        posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(actions.get(), child_end, STDOUT_FILENO);
    }
    posix_spawn_file_actions_adddup2(actions.get(), stderr_fd_, STDERR_FILENO);

    std::vector<char*> cargv;
    cargv.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        cargv.push_back(arg.data());
    }
    cargv.push_back(nullptr);

    int rc = posix_spawnp(&pid_, cargv[0], actions.get(), nullptr, cargv.data(), environ);
    ::close(child_end);
    if (rc != 0) {
        ::close(pipe_fd_);
        ::close(stderr_fd_);
        pipe_fd_ = -1;
        stderr_fd_ = -1;
        pid_ = -1;
        throw ExternalProcessError("failed to start " + argv_[0] + ": " + ErrnoText(rc));
    }
    ::fcntl(pipe_fd_, F_SETFL, ::fcntl(pipe_fd_, F_GETFL) | O_NONBLOCK);
}

Subprocess::~Subprocess() {
    if (pipe_fd_ >= 0) {
        ::close(pipe_fd_);
    }
    if (pid_ > 0 && !reaped_) {
        Kill();
    }
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
    }
}

void Subprocess::Kill() noexcept {
    if (pid_ <= 0 || reaped_) {
        return;
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
    status_ = status;
}

void Subprocess::Fail(const std::string& message, int status) {
    Kill();
    throw ExternalProcessError(argv_[0] + ": " + message, status, StderrTail());
}

int Subprocess::PollFor(short events) {
    pollfd pfd{};
    pfd.fd = pipe_fd_;
    pfd.events = events;
    const auto ms = std::min<std::int64_t>(timeout_.count(), std::numeric_limits<int>::max());
    while (true) {
        int rc = ::poll(&pfd, 1, static_cast<int>(ms));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc < 0) {
            Fail("poll failed: " + ErrnoText(errno));
        }
        if (rc == 0) {
            Fail("timed out after " + std::to_string(timeout_.count() / 1000) + "s without progress");
        }
        return pfd.revents;
    }
}

void Subprocess::Write(const std::uint8_t* data, std::size_t size) {
    if (mode_ != PipeMode::Stdin || pipe_fd_ < 0) {
        throw std::logic_error("Subprocess::Write on a process without piped stdin");
    }
    std::size_t offset = 0;
    while (offset < size) {
        PollFor(POLLOUT);
        ssize_t n = ::write(pipe_fd_, data + offset, size - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            continue;
        }
        const int err = errno;
        ::close(pipe_fd_);
        pipe_fd_ = -1;
        const int status = Wait();
        throw ExternalProcessError(argv_[0] + " stopped reading input (" + ErrnoText(err) + ")", status,
                                   StderrTail());
    }
}

void Subprocess::CloseInput() {
    if (mode_ == PipeMode::Stdin && pipe_fd_ >= 0) {
        ::close(pipe_fd_);
        pipe_fd_ = -1;
    }
}

std::size_t Subprocess::Read(std::uint8_t* data, std::size_t size) {
    if (mode_ != PipeMode::Stdout) {
        throw std::logic_error("Subprocess::Read on a process without piped stdout");
    }
    if (pipe_fd_ < 0) {
        return 0;
    }
    std::size_t offset = 0;
    while (offset < size) {
        PollFor(POLLIN);
        ssize_t n = ::read(pipe_fd_, data + offset, size - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0) {
            ::close(pipe_fd_);
            pipe_fd_ = -1;
            break;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            continue;
        }
        Fail("read failed: " + ErrnoText(errno));
    }
    return offset;
}

int Subprocess::Wait() {
    if (!reaped_) {
        if (pipe_fd_ >= 0 && mode_ == PipeMode::Stdin) {
            CloseInput();
        }
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        while (true) {
            int status = 0;
            pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc == pid_) {
                reaped_ = true;
                status_ = status;
                break;
            }
            if (rc < 0 && errno != EINTR) {
                Fail("waitpid failed: " + ErrnoText(errno));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                Fail("did not exit within " + std::to_string(timeout_.count() / 1000) + "s");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    if (WIFEXITED(status_)) {
        return WEXITSTATUS(status_);
    }
    if (WIFSIGNALED(status_)) {
        throw ExternalProcessError(argv_[0] + " killed by signal " + std::to_string(WTERMSIG(status_)), -1,
                                   StderrTail());
    }
    return -1;
}

void Subprocess::Finish() {
    int status = Wait();
    if (status != 0) {
        throw ExternalProcessError(argv_[0] + " exited with status " + std::to_string(status), status,
                                   StderrTail());
    }
}

std::string Subprocess::StderrTail(std::size_t max_bytes) const {
    if (stderr_fd_ < 0) {
        return {};
    }
    off_t end = ::lseek(stderr_fd_, 0, SEEK_END);
    if (end <= 0) {
        return {};
    }
    off_t start = end > static_cast<off_t>(max_bytes) ? end - static_cast<off_t>(max_bytes) : 0;
    std::string out(static_cast<std::size_t>(end - start), '\0');
    ssize_t n = ::pread(stderr_fd_, out.data(), out.size(), start);
    if (n <= 0) {
        return {};
    }
    out.resize(static_cast<std::size_t>(n));
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}

std::string RunCapture(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    Subprocess proc(argv, PipeMode::Stdout, timeout);
    std::string output;
    std::uint8_t buffer[4096];
    while (true) {
        std::size_t n = proc.Read(buffer, sizeof(buffer));
        output.append(reinterpret_cast<const char*>(buffer), n);
        if (n < sizeof(buffer)) {
            break;
        }
    }
    proc.Finish();
    return output;
}

}  // namespace vidstore::process
