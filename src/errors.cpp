#include "vidstore/errors.hpp"

#include <utility>

namespace vidstore {

namespace {

std::string WithDiagnostic(const std::string& message, const std::string& diagnostic) {
    if (diagnostic.empty()) {
        return message;
    }
    return message + "\n" + diagnostic;
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::HeaderUnrecoverable:
        return "HeaderUnrecoverable";
    case ErrorKind::UncorrectableChunk:
        return "UncorrectableChunk";
    case ErrorKind::Authentication:
        return "AuthenticationError";
    case ErrorKind::ExternalProcess:
        return "ExternalProcessError";
    case ErrorKind::Parameter:
        return "ParameterError";
    case ErrorKind::Integrity:
        return "IntegrityError";
    case ErrorKind::Io:
        return "IoError";
    }
    return "Error";
}

int ExitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parameter:
        return 2;
    case ErrorKind::HeaderUnrecoverable:
        return 3;
    case ErrorKind::UncorrectableChunk:
        return 4;
    case ErrorKind::Authentication:
        return 5;
    case ErrorKind::ExternalProcess:
        return 6;
    case ErrorKind::Integrity:
        return 7;
    case ErrorKind::Io:
        return 8;
    }
    return 1;
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

HeaderUnrecoverable::HeaderUnrecoverable(const std::string& message)
    : Error(ErrorKind::HeaderUnrecoverable, "header unrecoverable: " + message) {}

UncorrectableChunk::UncorrectableChunk(std::size_t index, std::size_t byte_offset, std::size_t frame)
    : Error(ErrorKind::UncorrectableChunk,
            "chunk " + std::to_string(index) + " (body offset " + std::to_string(byte_offset)
                + ", frame " + std::to_string(frame) + ") exceeds error-correction capacity"),
      index_(index),
      byte_offset_(byte_offset),
      frame_(frame) {}

AuthenticationError::AuthenticationError(const std::string& message)
    : Error(ErrorKind::Authentication, message) {}

ExternalProcessError::ExternalProcessError(const std::string& message, int exit_status, std::string diagnostic)
    : Error(ErrorKind::ExternalProcess, WithDiagnostic(message, diagnostic)),
      exit_status_(exit_status),
      diagnostic_(std::move(diagnostic)) {}

ParameterError::ParameterError(const std::string& message)
    : Error(ErrorKind::Parameter, message) {}

IntegrityError::IntegrityError(const std::string& message)
    : Error(ErrorKind::Integrity, message) {}

IoError::IoError(const std::string& message)
    : Error(ErrorKind::Io, message) {}

}  // namespace vidstore
