#include "orchestrator/WebhookOrchestratorClient.hpp"

#include "orchestrator/ProcUtil.hpp"
#include "resume/Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using resume::ErrorKind;
using resume::ResumeError;

namespace orchestrator {

namespace {

constexpr int kCurlCouldNotResolve = 6;
constexpr int kCurlCouldNotConnect = 7;
constexpr int kCurlTimedOut = 28;

std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Scratch directory for payload/response files, removed on scope exit.
class ScratchDir {
public:
    ScratchDir() {
        const std::string pattern = (fs::temp_directory_path() / "resume_orch_XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw ResumeError(ErrorKind::UpstreamError,
                              std::string("could not create scratch directory: ") + std::strerror(errno));
        }
        path_ = buf.data();
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace

WebhookOrchestratorClient::WebhookOrchestratorClient(const std::string& url, int timeout_seconds)
    : url_(url), timeout_seconds_(timeout_seconds) {}

void WebhookOrchestratorClient::check_transport(int curl_exit, int http_status, const std::string& body,
                                                const std::string& url, int timeout_seconds) {
    if (curl_exit == kCurlCouldNotResolve || curl_exit == kCurlCouldNotConnect) {
        throw ResumeError(ErrorKind::UpstreamUnavailable, "could not connect to the orchestrator at " + url);
    }
    if (curl_exit == kCurlTimedOut) {
        throw ResumeError(ErrorKind::UpstreamTimeout,
                          "orchestrator did not answer within " + std::to_string(timeout_seconds) + "s");
    }
    if (curl_exit != 0) {
        throw ResumeError(ErrorKind::UpstreamError, "curl failed with exit code " + std::to_string(curl_exit));
    }
    if (http_status < 200 || http_status >= 300) {
        throw ResumeError(ErrorKind::UpstreamError,
                          "orchestrator returned HTTP " + std::to_string(http_status) + ": " + body);
    }
}

OrchestratorResponse WebhookOrchestratorClient::send_resume(const std::string& text, bool adjust) {
    std::cerr << "[info] sending resume to orchestrator | adjust=" << (adjust ? "true" : "false")
              << " | url=" << url_ << " | timeout=" << timeout_seconds_ << "s\n";

    ScratchDir scratch;
    const fs::path payload = scratch.path() / "payload.json";
    const fs::path resp = scratch.path() / "response.json";

    {
        json j;
        j["resume_text"] = text;
        j["adjust"] = adjust;

        std::ofstream f(payload, std::ios::out | std::ios::trunc);
        if (!f) throw ResumeError(ErrorKind::UpstreamError, "failed to write request payload");
        f << j.dump();
    }

    // body goes to a file, the status code to stdout
    std::ostringstream cmd;
    cmd << "curl -s -X POST "
        << "-H 'Content-Type: application/json' "
        << "--data-binary @" << procutil::shell_quote(payload.string()) << " "
        << "-o " << procutil::shell_quote(resp.string()) << " "
        << "-w '%{http_code}' "
        << "--max-time " << timeout_seconds_ << " "
        << procutil::shell_quote(url_);

    const procutil::ProcResult pr = procutil::run_capture(cmd.str());

    std::string body;
    {
        std::ifstream rf(resp, std::ios::in | std::ios::binary);
        if (rf) body = read_all(rf);
    }

    const int status = std::atoi(pr.output.c_str());
    try {
        check_transport(pr.exit_code, status, body, url_, timeout_seconds_);
    } catch (const ResumeError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        throw;
    }

    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::exception& e) {
        throw ResumeError(ErrorKind::UpstreamError, std::string("orchestrator returned invalid JSON: ") + e.what());
    }

    std::cerr << "[info] orchestrator response received\n";
    return normalize_response(parsed, adjust);
}

} // namespace orchestrator
