#include "resume/Paginator.hpp"

#include "text/TextUtil.hpp"

#include <algorithm>
#include <cmath>

namespace resume {

// tolerance for floating point accumulation when checking fits
static constexpr double kFitEpsilon = 1e-6;

static std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : text) {
        if (c == ' ' || c == '\t') {
            if (!cur.empty()) {
                words.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

std::vector<std::string> wrap_text(const std::string& text, double max_width,
                                   const TextStyle& style, const TextMeasurer& measurer) {
    const std::vector<std::string> words = split_words(text);
    if (words.empty()) return {""};

    std::vector<std::string> lines;
    std::string current;

    for (const auto& w : words) {
        const std::string candidate = current.empty() ? w : current + " " + w;
        if (measurer.text_width(style, candidate) <= max_width) {
            current = candidate;
            continue;
        }

        if (!current.empty()) {
            lines.push_back(current);
            current.clear();
        }

        if (measurer.text_width(style, w) <= max_width) {
            current = w;
            continue;
        }

        // the word alone is too wide: break it between code points
        std::string piece;
        for (char32_t cp : textutil::decode_utf8(w)) {
            std::string trial = piece;
            textutil::append_utf8(trial, cp);
            if (!piece.empty() && measurer.text_width(style, trial) > max_width) {
                lines.push_back(piece);
                piece.clear();
                textutil::append_utf8(piece, cp);
            } else {
                piece = std::move(trial);
            }
        }
        current = piece;
    }

    if (!current.empty()) lines.push_back(current);
    return lines;
}

double two_column_width(const StyleConfig& style) {
    return style.page.content_width() / 2.0 - style.column_gutter;
}

static BoxMetrics text_box(const TextStyle& ts, size_t line_count) {
    BoxMetrics b;
    b.space_before = ts.space_before;
    b.space_after = ts.space_after;
    b.line_count = line_count;
    b.line_height = ts.leading;
    b.height = static_cast<double>(line_count) * ts.leading;
    b.splittable = true;
    return b;
}

static PreparedElement prepare_one(const FlowElement& element, const StyleConfig& style,
                                   const TextMeasurer& measurer) {
    PreparedElement p;
    p.element = element;

    const double frame_width = style.page.content_width();

    if (const auto* t = std::get_if<TextElement>(&element)) {
        const TextStyle& ts = text_style_for(t->role, style);
        p.lines = wrap_text(t->text, frame_width - ts.left_indent, ts, measurer);
        p.box = text_box(ts, p.lines.size());
    } else if (const auto* h = std::get_if<SectionHeaderElement>(&element)) {
        p.lines.push_back(h->title);
        p.box.space_before = style.section_header_space_before;
        p.box.space_after = style.section_header_space_after;
        p.box.height = style.section_header_height;
        p.box.line_count = 1;
        p.box.line_height = style.section_header_height;
    } else if (const auto* b = std::get_if<BulletElement>(&element)) {
        const TextStyle& ts = style.bullet;
        p.lines = wrap_text(b->text, frame_width - ts.left_indent, ts, measurer);
        p.box = text_box(ts, p.lines.size());
    } else if (const auto* r = std::get_if<TwoColumnRow>(&element)) {
        const TextStyle& ts = style.skill_item;
        const double marker = measurer.text_width(ts, kSkillMarker);
        const double cell_text_width = two_column_width(style) - marker - kCellRightPadding;

        if (!r->left.empty()) p.lines = wrap_text(r->left, cell_text_width, ts, measurer);
        if (!r->right.empty()) p.right_lines = wrap_text(r->right, cell_text_width, ts, measurer);

        const size_t rows = std::max<size_t>(1, std::max(p.lines.size(), p.right_lines.size()));
        p.box.space_before = ts.space_before;
        p.box.space_after = ts.space_after;
        p.box.line_count = rows;
        p.box.line_height = ts.leading;
        p.box.height = static_cast<double>(rows) * ts.leading + 2.0 * style.row_padding;
    }

    return p;
}

std::vector<PreparedElement> prepare_elements(const std::vector<FlowElement>& elements,
                                              const StyleConfig& style,
                                              const TextMeasurer& measurer) {
    std::vector<PreparedElement> out;
    out.reserve(elements.size());
    for (const auto& e : elements) out.push_back(prepare_one(e, style, measurer));
    return out;
}

std::vector<Page> paginate(const std::vector<BoxMetrics>& boxes, double frame_height) {
    std::vector<Page> pages(1);
    double y = 0.0;

    auto new_page = [&]() {
        pages.emplace_back();
        y = 0.0;
    };

    auto place = [&](size_t index, size_t first, size_t count, double top, double height) {
        pages.back().placements.push_back(Placement{index, first, count, top, height});
    };

    for (size_t i = 0; i < boxes.size(); ++i) {
        const BoxMetrics& b = boxes[i];
        const double before = (y > 0.0) ? b.space_before : 0.0;

        if (y + before + b.height <= frame_height + kFitEpsilon) {
            place(i, 0, b.line_count, y + before, b.height);
            y += before + b.height + b.space_after;
            continue;
        }

        const bool fits_empty_page = b.height <= frame_height + kFitEpsilon;
        if (fits_empty_page || !b.splittable || b.line_count == 0 || b.line_height <= 0.0) {
            if (y > 0.0) new_page();
            place(i, 0, b.line_count, 0.0, b.height);
            y = b.height + b.space_after;
            continue;
        }

        // taller than a whole page: cut between lines
        size_t line = 0;
        while (line < b.line_count) {
            const double gap = (y > 0.0 && line == 0) ? b.space_before : 0.0;
            const double room = frame_height - y - gap;
            size_t fit = (room > 0.0) ? static_cast<size_t>(std::floor((room + kFitEpsilon) / b.line_height)) : 0;

            if (fit == 0) {
                if (y > 0.0) {
                    new_page();
                    continue;
                }
                fit = 1;  // a single line taller than the frame still has to go somewhere
            }

            fit = std::min(fit, b.line_count - line);
            const double h = static_cast<double>(fit) * b.line_height;
            place(i, line, fit, y + gap, h);
            y += gap + h;
            line += fit;

            if (line < b.line_count) new_page();
        }
        y += b.space_after;
    }

    return pages;
}

}  // namespace resume
