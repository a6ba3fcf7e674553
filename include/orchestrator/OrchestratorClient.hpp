#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace orchestrator {

struct OrchestratorResponse {
    std::string analysis;
    std::string suggestions;
    std::optional<std::int64_t> score;  // unchecked, as received
    std::string rewritten_resume;  // only filled in adjust mode
};

// Accepts the shapes the workflow answers with:
//   [{...}]                      -> first element
//   {"output": "..."}            -> output used for every text field
//   {"analysis": ..., "suggestions": ..., "score": N, "rewritten_resume": ...}
// Throws resume::ResumeError(UpstreamError) when the body is not an object.
OrchestratorResponse normalize_response(const nlohmann::json& body, bool adjust);

class OrchestratorClient {
public:
    virtual ~OrchestratorClient() = default;

    // Sends the extracted resume text for analysis (and rewriting when adjust is set).
    virtual OrchestratorResponse send_resume(const std::string& text, bool adjust) = 0;
};

// What the analyze command reports when no PDF is produced.
struct AnalysisResult {
    std::string analysis;
    std::string suggestions;
    std::optional<int> score;

    nlohmann::json to_json() const;
};

// Throws ResumeError(UpstreamError) for a score outside 0..10.
AnalysisResult make_analysis_result(const OrchestratorResponse& r);

} // namespace orchestrator
