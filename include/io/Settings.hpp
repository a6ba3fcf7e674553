#pragma once

#include <cstddef>
#include <string>

// Collaborator settings: orchestration webhook and upload limits.
struct Settings {
    std::string webhook_url = "http://localhost:5678/webhook/resume";
    int timeout_seconds = 120;
    int max_file_size_mb = 5;

    size_t max_file_size_bytes() const {
        return static_cast<size_t>(max_file_size_mb) * 1024 * 1024;
    }
};
