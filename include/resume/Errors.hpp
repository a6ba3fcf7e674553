#pragma once

#include <stdexcept>
#include <string>

namespace resume {

enum class ErrorKind {
    Validation,
    SizeLimit,
    UpstreamUnavailable,
    UpstreamTimeout,
    UpstreamError,
    RenderFailed
};

// "validation", "size-limit", "upstream-unavailable", ...
const char* kind_name(ErrorKind k);

// process exit code used by the command line front end
int exit_code_for(ErrorKind k);

class ResumeError : public std::runtime_error {
public:
    ResumeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace resume
