#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <cairo.h>

#include "resume/LayoutEngine.hpp"
#include "resume/Style.hpp"
#include "resume/TextMeasurer.hpp"

namespace resume {

// Measures with cairo's toy font API on an existing context.
class CairoTextMeasurer final : public TextMeasurer {
public:
    CairoTextMeasurer(cairo_t* cr, std::string font_family);

    double text_width(const TextStyle& style, const std::string& text) const override;

private:
    cairo_t* cr_;
    std::string family_;
};

struct RenderedPdf {
    std::string bytes;
    size_t page_count = 0;
};

// Streams flow elements onto pages. Same input and style -> same bytes.
// Throws ResumeError(RenderFailed) on cairo errors or when max_pages is exceeded.
RenderedPdf render_pdf(const std::vector<FlowElement>& elements,
                       const std::string& title,
                       const StyleConfig& style);

// sanitize -> parse -> layout -> render
RenderedPdf render_resume_pdf(const std::string& candidate_name,
                              const std::string& resume_text,
                              const StyleConfig& style);

struct PdfFile {
    std::filesystem::path path;
    size_t page_count = 0;
};

// Writes to output_path, or to a new resume_XXXXXX.pdf in the temp directory.
// The caller owns the file.
PdfFile write_resume_pdf(const std::string& candidate_name,
                         const std::string& resume_text,
                         const StyleConfig& style,
                         const std::optional<std::filesystem::path>& output_path = std::nullopt);

// First line of the text when shorter than 60 characters, else "Candidate".
std::string candidate_name_from_text(const std::string& resume_text);

void write_pdf_bytes(const std::filesystem::path& path, const std::string& bytes);

std::filesystem::path make_temp_pdf_path();

}  // namespace resume
