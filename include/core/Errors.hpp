#pragma once

#include <stdexcept>
#include <string>

namespace corkboard {
namespace core {

enum class ParseErrorKind {
    UnknownFormat,
    MalformedDocument,
    MissingTitle,
    MissingLink
};

inline const char* toString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnknownFormat: return "UnknownFormat";
        case ParseErrorKind::MalformedDocument: return "MalformedDocument";
        case ParseErrorKind::MissingTitle: return "MissingTitle";
        case ParseErrorKind::MissingLink: return "MissingLink";
    }
    return "Unknown";
}

// Raised by the format parser, tagged with what went wrong
class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(toString(kind)) + ": " + message), kind_(kind) {}

    ParseErrorKind kind() const noexcept { return kind_; }

private:
    ParseErrorKind kind_;
};

// Transport failures: bad status, unreachable host, empty body
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& message) : std::runtime_error(message) {}
};

// Persistence failures, including identity-key consistency violations
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace core
} // namespace corkboard
