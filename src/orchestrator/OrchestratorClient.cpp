#include "orchestrator/OrchestratorClient.hpp"

#include "resume/Errors.hpp"

#include <limits>

using json = nlohmann::json;
using resume::ErrorKind;
using resume::ResumeError;

namespace orchestrator {

static std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

static std::optional<std::int64_t> score_field(const json& j) {
    if (!j.contains("score")) return std::nullopt;
    const json& score = j["score"];
    if (score.is_number_unsigned()) {
        const std::uint64_t u = score.get<std::uint64_t>();
        const auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        return static_cast<std::int64_t>(u > max ? max : u);
    }
    if (score.is_number_integer()) return score.get<std::int64_t>();
    return std::nullopt;
}

OrchestratorResponse normalize_response(const json& body, bool adjust) {
    json data = body;
    if (data.is_array()) {
        data = data.empty() ? json::object() : data.at(0);
    }

    if (!data.is_object()) {
        throw ResumeError(ErrorKind::UpstreamError,
                          std::string("unexpected orchestrator response: ") + data.type_name());
    }

    OrchestratorResponse r;
    r.score = score_field(data);

    if (data.contains("output") && !data.contains("analysis")) {
        const std::string output = string_field(data, "output");
        r.analysis = output;
        r.suggestions = output;
        if (adjust) r.rewritten_resume = output;
        return r;
    }

    r.analysis = string_field(data, "analysis");
    r.suggestions = string_field(data, "suggestions");
    r.rewritten_resume = string_field(data, "rewritten_resume");
    if (r.rewritten_resume.empty() && adjust) r.rewritten_resume = r.analysis;
    return r;
}

json AnalysisResult::to_json() const {
    json j;
    j["analysis"] = analysis;
    j["suggestions"] = suggestions;
    j["score"] = score ? json(*score) : json(nullptr);
    return j;
}

AnalysisResult make_analysis_result(const OrchestratorResponse& r) {
    if (r.score && (*r.score < 0 || *r.score > 10)) {
        throw ResumeError(ErrorKind::UpstreamError,
                          "orchestrator returned a score outside 0..10: " + std::to_string(*r.score));
    }

    AnalysisResult a;
    a.analysis = r.analysis;
    a.suggestions = r.suggestions;
    if (r.score) a.score = static_cast<int>(*r.score);
    return a;
}

} // namespace orchestrator
