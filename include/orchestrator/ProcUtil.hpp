#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1 when the process could not be started or did not exit normally
    std::string output;   // captured stdout
};

// Runs a command line through /bin/sh and captures its stdout.
ProcResult run_capture(const std::string& cmdline);

// Single-quotes s for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace procutil
