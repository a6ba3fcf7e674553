// include/resume/DocumentArtifact.hpp
#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"
#include "resume/Document.hpp"

namespace resume {

nlohmann::json document_to_json(const Document& doc);

void write_document_json(const std::filesystem::path& out_path, const Document& doc);

}  // namespace resume
