#include "orchestrator/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture(const std::string& cmdline) {
    ProcResult r;

    FILE* pipe = popen(cmdline.c_str(), "r");
    if (!pipe) return r;

    r.output.reserve(8192);
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        r.output.append(buf, n);
    }

    const int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    return r;
}

std::string shell_quote(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 2);
    o += '\'';
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += '\'';
    return o;
}

} // namespace procutil
