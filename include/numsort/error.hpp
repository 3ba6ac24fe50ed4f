#pragma once

#include <stdexcept>
#include <string>

namespace numsort {

enum class ErrorKind {
    NotFound,       // input path could not be opened
    InvalidInput,   // a non-blank input line is not a number
    Io              // output path could not be created or written
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:     return "not-found";
        case ErrorKind::InvalidInput: return "invalid-input";
        case ErrorKind::Io:           return "io";
    }
    return "unknown";
}

// Base of every failure the driver reports; what() is the user-facing detail
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& path)
        : Error(ErrorKind::NotFound, "File '" + path + "' not found"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class InvalidInputError : public Error {
public:
    InvalidInputError(const std::string& text, int line)
        : Error(ErrorKind::InvalidInput,
                "Invalid number '" + text + "' on line " + std::to_string(line)),
          text_(text), line_(line) {}

    const std::string& text() const { return text_; }
    int line() const { return line_; }

private:
    std::string text_;
    int line_;
};

class IoError : public Error {
public:
    IoError(const std::string& path, const std::string& reason)
        : Error(ErrorKind::Io, "Cannot write to file '" + path + "': " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace numsort
