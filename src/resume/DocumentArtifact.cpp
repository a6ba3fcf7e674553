#include "resume/DocumentArtifact.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace resume {

static nlohmann::json section_to_json(const SectionBlock& s) {
    nlohmann::json j;
    j["type"] = "section";
    j["title"] = s.title;

    nlohmann::json items = nlohmann::json::array();
    for (const auto& it : s.items) {
        items.push_back({{"type", item_kind_str(it.kind)}, {"text", it.text}});
    }
    j["items"] = items;

    return j;
}

nlohmann::json document_to_json(const Document& doc) {
    nlohmann::json arr = nlohmann::json::array();

    for (const auto& block : doc.blocks) {
        std::visit([&](const auto& b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, NameBlock>) {
                arr.push_back({{"type", "name"}, {"content", b.content}});
            } else if constexpr (std::is_same_v<T, ContactBlock>) {
                arr.push_back({{"type", "contact"}, {"content", b.content}});
            } else {
                arr.push_back(section_to_json(b));
            }
        }, block);
    }

    nlohmann::json j;
    j["blocks"] = arr;
    return j;
}

void write_document_json(const std::filesystem::path& out_path, const Document& doc) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << document_to_json(doc).dump(2) << "\n";
}

}  // namespace resume
