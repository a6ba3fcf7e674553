#include "orchestrator/MockOrchestratorClient.hpp"

#include "resume/Errors.hpp"

#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;
using resume::ErrorKind;
using resume::ResumeError;

namespace orchestrator {

MockOrchestratorClient::MockOrchestratorClient(const std::string& root_dir) : root_(root_dir) {}

OrchestratorResponse MockOrchestratorClient::send_resume(const std::string&, bool adjust) {
    const fs::path p = root_ / (adjust ? "adjust.json" : "analyze.json");
    std::ifstream f(p);
    if (!f) {
        throw ResumeError(ErrorKind::UpstreamUnavailable, "no canned response at " + p.string());
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ResumeError(ErrorKind::UpstreamError,
                          "invalid JSON in " + p.string() + ": " + e.what());
    }

    return normalize_response(j, adjust);
}

} // namespace orchestrator
