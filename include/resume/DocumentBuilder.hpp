#pragma once

#include <optional>
#include <string>
#include <vector>

#include "resume/Document.hpp"
#include "resume/LineClassifier.hpp"

namespace resume {

// Assembles a Document from classified lines in one linear pass.
class DocumentBuilder {
public:
    void add(const ClassifiedLine& line);

    // Flushes pending contact lines; the builder is spent afterwards.
    Document finish();

private:
    void flush_contact();
    SectionBlock& open_section(const std::string& title);
    SectionBlock& current_section();
    void append_item(ItemKind kind, const std::string& text);

    Document doc_;
    std::vector<std::string> contact_lines_;
    std::optional<size_t> current_section_;   // index into doc_.blocks
};

// sanitize -> classify -> build
Document parse_resume(const std::string& text);

}  // namespace resume
