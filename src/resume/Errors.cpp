#include "resume/Errors.hpp"

namespace resume {

const char* kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::SizeLimit: return "size-limit";
        case ErrorKind::UpstreamUnavailable: return "upstream-unavailable";
        case ErrorKind::UpstreamTimeout: return "upstream-timeout";
        case ErrorKind::UpstreamError: return "upstream-error";
        case ErrorKind::RenderFailed: return "rendering-failed";
        default: return "unknown";
    }
}

int exit_code_for(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation: return 2;
        case ErrorKind::SizeLimit: return 3;
        case ErrorKind::UpstreamUnavailable:
        case ErrorKind::UpstreamTimeout:
        case ErrorKind::UpstreamError: return 4;
        case ErrorKind::RenderFailed: return 5;
        default: return 1;
    }
}

}  // namespace resume
