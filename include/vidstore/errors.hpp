#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vidstore {

enum class ErrorKind {
    HeaderUnrecoverable,
    UncorrectableChunk,
    Authentication,
    ExternalProcess,
    Parameter,
    Integrity,
    Io
};

const char* ErrorKindName(ErrorKind kind);

// Process exit code the CLI uses for each kind.
int ExitCodeFor(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class HeaderUnrecoverable : public Error {
public:
    explicit HeaderUnrecoverable(const std::string& message);
};

class UncorrectableChunk : public Error {
public:
    UncorrectableChunk(std::size_t index, std::size_t byte_offset, std::size_t frame);

    std::size_t index() const noexcept { return index_; }
    std::size_t byte_offset() const noexcept { return byte_offset_; }
    std::size_t frame() const noexcept { return frame_; }

private:
    std::size_t index_;
    std::size_t byte_offset_;
    std::size_t frame_;
};

class AuthenticationError : public Error {
public:
    explicit AuthenticationError(const std::string& message);
};

class ExternalProcessError : public Error {
public:
    ExternalProcessError(const std::string& message, int exit_status = -1, std::string diagnostic = {});

    int exit_status() const noexcept { return exit_status_; }
    const std::string& diagnostic() const noexcept { return diagnostic_; }

private:
    int exit_status_;
    std::string diagnostic_;
};

class ParameterError : public Error {
public:
    explicit ParameterError(const std::string& message);
};

class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string& message);
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message);
};

}  // namespace vidstore
