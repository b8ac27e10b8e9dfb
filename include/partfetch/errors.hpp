#pragma once

#include <stdexcept>
#include <string>

namespace partfetch {

enum class ErrorKind {
    InvalidRange,
    Connection,
    Stream,
    PartFile
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidRange final : public DownloadError {
public:
    explicit InvalidRange(const std::string& message)
        : DownloadError(ErrorKind::InvalidRange, message) {}
};

class ConnectionError final : public DownloadError {
public:
    explicit ConnectionError(const std::string& message)
        : DownloadError(ErrorKind::Connection, message) {}
};

class StreamError final : public DownloadError {
public:
    explicit StreamError(const std::string& message)
        : DownloadError(ErrorKind::Stream, message) {}
};

class PartFileError final : public DownloadError {
public:
    explicit PartFileError(const std::string& message)
        : DownloadError(ErrorKind::PartFile, message) {}
};

} // namespace partfetch
