#pragma once

#include <string>
#include <vector>

namespace resume {

struct Rgb {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

// "#1B2A4A" -> {0.106, 0.165, 0.290}; throws std::invalid_argument
Rgb rgb_from_hex(const std::string& hex);

enum class TextAlign {
    Left,
    Justify
};

struct TextStyle {
    bool bold = false;
    bool italic = false;
    double size = 9.5;               // pt
    double leading = 13.0;           // baseline-to-baseline
    double space_before = 0.0;
    double space_after = 0.0;
    double left_indent = 0.0;
    TextAlign align = TextAlign::Left;
    Rgb color;
};

inline constexpr double kPointsPerCm = 72.0 / 2.54;

struct PageGeometry {
    double width = 595.2756;         // A4
    double height = 841.8898;
    double margin_top = 1.5 * kPointsPerCm;
    double margin_bottom = 1.5 * kPointsPerCm;
    double margin_left = 2.0 * kPointsPerCm;
    double margin_right = 2.0 * kPointsPerCm;

    double content_width() const { return width - margin_left - margin_right; }
    double content_height() const { return height - margin_top - margin_bottom; }
};

inline constexpr Rgb kNavy{0x1B / 255.0, 0x2A / 255.0, 0x4A / 255.0};
inline constexpr Rgb kDarkText{0x2C / 255.0, 0x2C / 255.0, 0x2C / 255.0};
inline constexpr Rgb kLightText{0x55 / 255.0, 0x55 / 255.0, 0x55 / 255.0};

struct Palette {
    Rgb primary = kNavy;             // section titles
    Rgb accent = kNavy;              // bullet markers
    Rgb line = kNavy;                // rule under section titles
};

// Fixed look of the rendered document. Passed explicitly to layout and rendering.
struct StyleConfig {
    PageGeometry page;
    Palette palette;
    std::string font_family = "Helvetica";

    TextStyle name{true, false, 24.0, 28.0, 0.0, 2.0, 0.0, TextAlign::Left, kDarkText};
    TextStyle contact{false, false, 9.0, 12.0, 0.0, 12.0, 0.0, TextAlign::Left, kLightText};
    TextStyle section_title{true, false, 11.0, 14.0, 0.0, 0.0, 0.0, TextAlign::Left, kNavy};
    TextStyle body{false, false, 9.5, 13.0, 0.0, 4.0, 0.0, TextAlign::Justify, kDarkText};
    TextStyle job_title{true, false, 10.0, 13.0, 6.0, 2.0, 0.0, TextAlign::Left, kDarkText};
    TextStyle bullet{false, false, 9.5, 13.0, 0.0, 2.0, 14.0, TextAlign::Justify, kDarkText};
    TextStyle skill_item{false, false, 9.5, 13.0, 0.0, 0.0, 0.0, TextAlign::Left, kDarkText};

    // section header: title + rule at the bottom of a fixed-height band
    double section_header_height = 20.0;
    double section_header_space_before = 4.0;
    double section_header_space_after = 6.0;
    double section_title_baseline = 11.0;    // from the top of the band
    double rule_width = 0.8;

    double bullet_radius = 2.2;
    double bullet_center_x = 4.0;
    double bullet_center_y = 5.0;            // from the top of the element

    double column_gutter = 0.2 * kPointsPerCm;
    double row_padding = 1.0;
    size_t two_column_min_items = 4;
    std::vector<std::string> skills_keywords{"skill", "competenc", "habilidade", "software", "ferramenta", "tool"};

    std::string author = "Resume Formatter";
    std::string creation_date = "2000-01-01T00:00:00Z";  // fixed so output is byte-identical
    int max_pages = 500;
};

}  // namespace resume
