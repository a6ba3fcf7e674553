#pragma once

#include "orchestrator/OrchestratorClient.hpp"

#include <string>

namespace orchestrator {

// POSTs {"resume_text":...,"adjust":...} to the workflow webhook with curl.
// Single attempt, bounded by timeout_seconds.
class WebhookOrchestratorClient final : public OrchestratorClient {
    std::string url_;
    int timeout_seconds_;

public:
    WebhookOrchestratorClient(const std::string& url, int timeout_seconds);

    OrchestratorResponse send_resume(const std::string& text, bool adjust) override;

    // curl exit code + HTTP status -> error kind; exposed for tests
    static void check_transport(int curl_exit, int http_status, const std::string& body,
                                const std::string& url, int timeout_seconds);
};

} // namespace orchestrator
