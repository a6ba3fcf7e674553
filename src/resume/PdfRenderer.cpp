#include "resume/PdfRenderer.hpp"

#include "resume/DocumentBuilder.hpp"
#include "resume/Errors.hpp"
#include "resume/Paginator.hpp"
#include "text/TextUtil.hpp"

#include <cairo-pdf.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

namespace resume {

namespace {

using SurfacePtr = std::unique_ptr<cairo_surface_t, decltype(&cairo_surface_destroy)>;
using ContextPtr = std::unique_ptr<cairo_t, decltype(&cairo_destroy)>;

constexpr double kTwoPi = 6.283185307179586;

cairo_status_t append_to_buffer(void* closure, const unsigned char* data, unsigned int length) {
    auto* out = static_cast<std::string*>(closure);
    out->append(reinterpret_cast<const char*>(data), length);
    return CAIRO_STATUS_SUCCESS;
}

void check_status(cairo_status_t st, const char* stage) {
    if (st == CAIRO_STATUS_SUCCESS) return;
    throw ResumeError(ErrorKind::RenderFailed,
                      std::string("rendering failed (") + stage + "): " + cairo_status_to_string(st));
}

void select_font(cairo_t* cr, const std::string& family, const TextStyle& ts) {
    cairo_select_font_face(cr, family.c_str(),
                           ts.italic ? CAIRO_FONT_SLANT_OBLIQUE : CAIRO_FONT_SLANT_NORMAL,
                           ts.bold ? CAIRO_FONT_WEIGHT_BOLD : CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr, ts.size);
}

void set_color(cairo_t* cr, const Rgb& c) {
    cairo_set_source_rgb(cr, c.r, c.g, c.b);
}

double advance(cairo_t* cr, const std::string& text) {
    cairo_text_extents_t te;
    cairo_text_extents(cr, text.c_str(), &te);
    return te.x_advance;
}

class PageDrawer {
public:
    PageDrawer(cairo_t* cr, const StyleConfig& style) : cr_(cr), style_(style) {}

    void draw(const PreparedElement& p, const Placement& at) {
        const double x = style_.page.margin_left;
        const double top = style_.page.margin_top + at.y;
        const double width = style_.page.content_width();

        if (const auto* t = std::get_if<TextElement>(&p.element)) {
            const TextStyle& ts = text_style_for(t->role, style_);
            draw_lines(ts, p.lines, at.first_line, at.line_count, x + ts.left_indent, top, width - ts.left_indent);
        } else if (const auto* h = std::get_if<SectionHeaderElement>(&p.element)) {
            draw_section_header(h->title, x, top, width);
        } else if (std::holds_alternative<BulletElement>(p.element)) {
            draw_bullet(p, at, x, top, width);
        } else if (std::holds_alternative<TwoColumnRow>(p.element)) {
            const double col = two_column_width(style_);
            draw_cell(p.lines, x, top + style_.row_padding, col);
            draw_cell(p.right_lines, x + col, top + style_.row_padding, col);
        }
    }

private:
    void draw_lines(const TextStyle& ts, const std::vector<std::string>& lines,
                    size_t first, size_t count, double x, double top, double width) {
        cairo_save(cr_);
        select_font(cr_, style_.font_family, ts);
        set_color(cr_, ts.color);

        cairo_font_extents_t fe;
        cairo_font_extents(cr_, &fe);

        for (size_t k = 0; k < count && first + k < lines.size(); ++k) {
            const size_t idx = first + k;
            const double baseline = top + static_cast<double>(k) * ts.leading + fe.ascent;
            const bool last_line = (idx + 1 == lines.size());

            if (ts.align == TextAlign::Justify && !last_line) {
                draw_justified(lines[idx], x, baseline, width);
            } else {
                cairo_move_to(cr_, x, baseline);
                cairo_show_text(cr_, lines[idx].c_str());
            }
        }

        cairo_restore(cr_);
    }

    void draw_justified(const std::string& line, double x, double baseline, double width) {
        std::vector<std::string> words;
        size_t i = 0;
        while (i < line.size()) {
            size_t j = line.find(' ', i);
            if (j == std::string::npos) j = line.size();
            if (j > i) words.push_back(line.substr(i, j - i));
            i = j + 1;
        }

        if (words.size() < 2) {
            cairo_move_to(cr_, x, baseline);
            cairo_show_text(cr_, line.c_str());
            return;
        }

        double total = 0.0;
        std::vector<double> widths;
        widths.reserve(words.size());
        for (const auto& w : words) {
            widths.push_back(advance(cr_, w));
            total += widths.back();
        }

        const double gap = std::max(0.0, (width - total) / static_cast<double>(words.size() - 1));
        double cursor = x;
        for (size_t k = 0; k < words.size(); ++k) {
            cairo_move_to(cr_, cursor, baseline);
            cairo_show_text(cr_, words[k].c_str());
            cursor += widths[k] + gap;
        }
    }

    void draw_section_header(const std::string& title, double x, double top, double width) {
        cairo_save(cr_);

        select_font(cr_, style_.font_family, style_.section_title);
        set_color(cr_, style_.palette.primary);
        cairo_move_to(cr_, x, top + style_.section_title_baseline);
        cairo_show_text(cr_, title.c_str());

        const double rule_y = top + style_.section_header_height;
        cairo_new_path(cr_);
        set_color(cr_, style_.palette.line);
        cairo_set_line_width(cr_, style_.rule_width);
        cairo_move_to(cr_, x, rule_y);
        cairo_line_to(cr_, x + width, rule_y);
        cairo_stroke(cr_);

        cairo_restore(cr_);
    }

    void draw_bullet(const PreparedElement& p, const Placement& at, double x, double top, double width) {
        const TextStyle& ts = style_.bullet;

        // continuation chunks on a later page carry no marker
        if (at.first_line == 0) {
            cairo_save(cr_);
            cairo_new_path(cr_);
            set_color(cr_, style_.palette.accent);
            cairo_arc(cr_, x + style_.bullet_center_x, top + style_.bullet_center_y,
                      style_.bullet_radius, 0.0, kTwoPi);
            cairo_fill(cr_);
            cairo_restore(cr_);
        }

        draw_lines(ts, p.lines, at.first_line, at.line_count, x + ts.left_indent, top, width - ts.left_indent);
    }

    void draw_cell(const std::vector<std::string>& lines, double x, double top, double col_width) {
        if (lines.empty()) return;

        const TextStyle& ts = style_.skill_item;

        cairo_save(cr_);
        select_font(cr_, style_.font_family, ts);
        cairo_font_extents_t fe;
        cairo_font_extents(cr_, &fe);
        const double marker = advance(cr_, kSkillMarker);

        set_color(cr_, style_.palette.accent);
        cairo_move_to(cr_, x, top + fe.ascent);
        cairo_show_text(cr_, kSkillMarker);
        cairo_restore(cr_);

        draw_lines(ts, lines, 0, lines.size(), x + marker, top, col_width - marker - kCellRightPadding);
    }

    cairo_t* cr_;
    const StyleConfig& style_;
};

}  // namespace

CairoTextMeasurer::CairoTextMeasurer(cairo_t* cr, std::string font_family)
    : cr_(cr), family_(std::move(font_family)) {}

double CairoTextMeasurer::text_width(const TextStyle& style, const std::string& text) const {
    cairo_save(cr_);
    select_font(cr_, family_, style);
    const double w = advance(cr_, text);
    cairo_restore(cr_);
    return w;
}

RenderedPdf render_pdf(const std::vector<FlowElement>& elements,
                       const std::string& title,
                       const StyleConfig& style) {
    std::string buffer;

    SurfacePtr surface(cairo_pdf_surface_create_for_stream(append_to_buffer, &buffer,
                                                           style.page.width, style.page.height),
                       &cairo_surface_destroy);
    check_status(cairo_surface_status(surface.get()), "surface");

    cairo_pdf_surface_set_metadata(surface.get(), CAIRO_PDF_METADATA_TITLE, title.c_str());
    cairo_pdf_surface_set_metadata(surface.get(), CAIRO_PDF_METADATA_AUTHOR, style.author.c_str());
    cairo_pdf_surface_set_metadata(surface.get(), CAIRO_PDF_METADATA_CREATOR, style.author.c_str());
    cairo_pdf_surface_set_metadata(surface.get(), CAIRO_PDF_METADATA_CREATE_DATE, style.creation_date.c_str());

    ContextPtr cr(cairo_create(surface.get()), &cairo_destroy);
    check_status(cairo_status(cr.get()), "context");

    const CairoTextMeasurer measurer(cr.get(), style.font_family);
    const std::vector<PreparedElement> prepared = prepare_elements(elements, style, measurer);

    std::vector<BoxMetrics> boxes;
    boxes.reserve(prepared.size());
    for (const auto& p : prepared) boxes.push_back(p.box);

    const std::vector<Page> pages = paginate(boxes, style.page.content_height());
    if (style.max_pages > 0 && pages.size() > static_cast<size_t>(style.max_pages)) {
        throw ResumeError(ErrorKind::RenderFailed,
                          "rendering failed: document needs " + std::to_string(pages.size()) +
                          " pages, limit is " + std::to_string(style.max_pages));
    }

    PageDrawer drawer(cr.get(), style);
    for (const auto& page : pages) {
        for (const auto& at : page.placements) drawer.draw(prepared[at.element], at);
        cairo_show_page(cr.get());
        check_status(cairo_status(cr.get()), "page");
    }

    cr.reset();
    cairo_surface_finish(surface.get());
    check_status(cairo_surface_status(surface.get()), "finish");
    surface.reset();

    RenderedPdf out;
    out.bytes = std::move(buffer);
    out.page_count = pages.size();
    return out;
}

RenderedPdf render_resume_pdf(const std::string& candidate_name,
                              const std::string& resume_text,
                              const StyleConfig& style) {
    const Document doc = parse_resume(textutil::make_valid_utf8(resume_text));
    const std::vector<FlowElement> elements = layout_document(doc, style);
    const std::string title = "Resume - " + textutil::sanitize(textutil::make_valid_utf8(candidate_name));
    return render_pdf(elements, title, style);
}

std::string candidate_name_from_text(const std::string& resume_text) {
    const std::string text = textutil::trim(resume_text);
    const std::string first = textutil::trim(text.substr(0, text.find('\n')));
    if (first.empty() || textutil::utf8_length(first) >= 60) return "Candidate";
    return first;
}

fs::path make_temp_pdf_path() {
    const std::string pattern = (fs::temp_directory_path() / "resume_XXXXXX.pdf").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int fd = mkstemps(buf.data(), 4);
    if (fd < 0) {
        throw ResumeError(ErrorKind::RenderFailed,
                          std::string("could not create temporary file: ") + std::strerror(errno));
    }
    close(fd);
    return fs::path(buf.data());
}

void write_pdf_bytes(const fs::path& path, const std::string& bytes) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ResumeError(ErrorKind::RenderFailed,
                              "Failed to create output directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw ResumeError(ErrorKind::RenderFailed, "Failed to open output file: " + path.string());

    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw ResumeError(ErrorKind::RenderFailed, "Failed to write output file: " + path.string());
}

PdfFile write_resume_pdf(const std::string& candidate_name,
                         const std::string& resume_text,
                         const StyleConfig& style,
                         const std::optional<fs::path>& output_path) {
    PdfFile out;
    out.path = output_path ? *output_path : make_temp_pdf_path();

    try {
        const RenderedPdf pdf = render_resume_pdf(candidate_name, resume_text, style);
        write_pdf_bytes(out.path, pdf.bytes);
        out.page_count = pdf.page_count;
    } catch (...) {
        // drop the temp file we created
        if (!output_path) {
            std::error_code ec;
            fs::remove(out.path, ec);
        }
        throw;
    }

    return out;
}

}  // namespace resume
