#pragma once

#include "orchestrator/OrchestratorClient.hpp"

#include <filesystem>
#include <string>

namespace orchestrator {

// Replays <root>/analyze.json or <root>/adjust.json.
class MockOrchestratorClient final : public OrchestratorClient {
    std::filesystem::path root_;

public:
    explicit MockOrchestratorClient(const std::string& root_dir);

    OrchestratorResponse send_resume(const std::string& text, bool adjust) override;
};

} // namespace orchestrator
