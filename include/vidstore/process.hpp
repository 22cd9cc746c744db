#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

namespace vidstore::process {

enum class PipeMode {
    Stdin,   // parent writes to the child's stdin
    Stdout   // parent reads the child's stdout
};

// VIDSTORE_PROCESS_TIMEOUT seconds, default 600.
std::chrono::milliseconds DefaultTimeout();

std::string JoinArgs(const std::vector<std::string>& args);

// Child process with one piped stream; the other standard stream is /dev/null and
// stderr is captured for diagnostics. Any read, write or wait that makes no progress
// for `timeout` kills the child and throws ExternalProcessError.
class Subprocess {
public:
    Subprocess(std::vector<std::string> argv, PipeMode mode, std::chrono::milliseconds timeout = DefaultTimeout());
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    void Write(const std::uint8_t* data, std::size_t size);
    void CloseInput();

    // Fills up to `size` bytes; fewer means the child closed its stdout.
    std::size_t Read(std::uint8_t* data, std::size_t size);

    // Exit status; throws ExternalProcessError on a signal or timeout.
    int Wait();

    // Wait() and throw ExternalProcessError unless the child exited with 0.
    void Finish();

    std::string StderrTail(std::size_t max_bytes = 2000) const;
    const std::string& command() const noexcept { return command_; }

private:
    [[noreturn]] void Fail(const std::string& message, int status = -1);
    void Kill() noexcept;
    int PollFor(short events);

    std::vector<std::string> argv_;
    std::string command_;
    PipeMode mode_;
    std::chrono::milliseconds timeout_;
    pid_t pid_ = -1;
    int pipe_fd_ = -1;
    int stderr_fd_ = -1;
    bool reaped_ = false;
    int status_ = 0;
};

// Runs the command to completion and returns its stdout.
std::string RunCapture(const std::vector<std::string>& argv, std::chrono::milliseconds timeout = DefaultTimeout());

}  // namespace vidstore::process
