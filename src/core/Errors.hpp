#pragma once
#include <stdexcept>
#include <string>

namespace Unclutter {

enum class ErrorKind {
    None,
    InvalidURL,
    RequestBuildError,
    FetchError,
    DecodeError,
    UnsupportedContentType,
    ParseError,
    Cancelled
};

const char* ToString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    bool timed_out = false;

    std::string Describe() const;
};

// Thrown by body streams when a read cannot continue. The pipeline turns it
// back into an Error before returning to the caller.
class AcquireError : public std::runtime_error {
public:
    AcquireError(ErrorKind kind, const std::string& message, bool timed_out = false)
        : std::runtime_error(message), kind_(kind), timed_out_(timed_out) {}

    ErrorKind kind() const { return kind_; }
    bool timed_out() const { return timed_out_; }

    Error ToError() const { return Error{kind_, what(), timed_out_}; }

private:
    ErrorKind kind_;
    bool timed_out_;
};

}
