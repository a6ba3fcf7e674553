#pragma once

#include <string>
#include <vector>

#include "resume/LayoutEngine.hpp"
#include "resume/Style.hpp"
#include "resume/TextMeasurer.hpp"

namespace resume {

// glyph run that opens each two-column cell
inline constexpr const char* kSkillMarker = "\xE2\x80\xA2 ";
inline constexpr double kCellRightPadding = 4.0;

// Greedy word wrap at spaces. Words wider than max_width are broken between
// code points. Empty text gives one empty line.
std::vector<std::string> wrap_text(const std::string& text, double max_width,
                                   const TextStyle& style, const TextMeasurer& measurer);

struct BoxMetrics {
    double space_before = 0.0;
    double height = 0.0;
    double space_after = 0.0;
    size_t line_count = 0;
    double line_height = 0.0;
    bool splittable = false;             // may be cut between lines when taller than a page
};

// A flow element with its text wrapped to the frame.
struct PreparedElement {
    FlowElement element;
    BoxMetrics box;
    std::vector<std::string> lines;        // text, bullet, or the left cell of a row
    std::vector<std::string> right_lines;  // right cell of a row
};

double two_column_width(const StyleConfig& style);

std::vector<PreparedElement> prepare_elements(const std::vector<FlowElement>& elements,
                                              const StyleConfig& style,
                                              const TextMeasurer& measurer);

struct Placement {
    size_t element = 0;                  // index into the prepared sequence
    size_t first_line = 0;
    size_t line_count = 0;
    double y = 0.0;                      // from the top of the frame
    double height = 0.0;
};

struct Page {
    std::vector<Placement> placements;
};

// Places boxes top to bottom, starting a new page whenever the next box does
// not fit in the remaining space. Order is preserved. space_before is dropped
// at the top of a page. Always yields at least one page.
std::vector<Page> paginate(const std::vector<BoxMetrics>& boxes, double frame_height);

}  // namespace resume
