#pragma once
#include <stdexcept>
#include <string>

namespace fenrom {

// Failure categories. Malformed and OutOfBounds are recoverable per puzzle,
// RecordTooLarge and Io end the run.
enum class ErrorKind
{
    Malformed,
    OutOfBounds,
    RecordTooLarge,
    Io,
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error
{
    ErrorKind errorKind;

public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }
};

// Unparseable move text.
class MoveError : public Error
{
public:
    explicit MoveError(const std::string& message) : Error(ErrorKind::Malformed, message) {}
};

// A move touched a square the expanded board does not have.
class BoardError : public Error
{
public:
    explicit BoardError(const std::string& message) : Error(ErrorKind::OutOfBounds, message) {}
};

// Unusable row from the puzzle source.
class RecordError : public Error
{
public:
    explicit RecordError(const std::string& message) : Error(ErrorKind::Malformed, message) {}
};

class RomError : public Error
{
public:
    explicit RomError(const std::string& message) : Error(ErrorKind::RecordTooLarge, message) {}
};

class IoError : public Error
{
public:
    explicit IoError(const std::string& message) : Error(ErrorKind::Io, message) {}
};

} // namespace fenrom
