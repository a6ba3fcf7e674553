#pragma once

#include <string>
#include <variant>
#include <vector>

#include "resume/Document.hpp"
#include "resume/Style.hpp"

namespace resume {

enum class StyleRole {
    Name,
    Contact,
    SectionHeader,
    Body,
    Bullet,
    JobTitle,
    SkillItem
};

// --- flow elements: the closed set the renderer knows how to draw ---

struct TextElement {
    StyleRole role = StyleRole::Body;    // Name, Contact, Body or JobTitle
    std::string text;
};

struct SectionHeaderElement {
    std::string title;                   // already upper-cased; a rule is drawn beneath
};

struct BulletElement {
    std::string text;
};

struct TwoColumnRow {
    std::string left;                    // empty = placeholder cell
    std::string right;
};

using FlowElement = std::variant<TextElement, SectionHeaderElement, BulletElement, TwoColumnRow>;

StyleRole role_of(const FlowElement& e);
const TextStyle& text_style_for(StyleRole role, const StyleConfig& style);

// Column A gets the first ceil(n/2) entries, column B the rest. Unpadded.
struct ColumnSplit {
    std::vector<std::string> left;
    std::vector<std::string> right;
};

ColumnSplit balance_columns(const std::vector<std::string>& items);

// Pads the shorter column with empty cells and pairs left[i] with right[i].
std::vector<TwoColumnRow> pair_rows(const ColumnSplit& split);

bool is_skills_title(const std::string& title, const StyleConfig& style);

// skills-like title, only bullets, at least style.two_column_min_items of them
bool uses_two_columns(const SectionBlock& section, const StyleConfig& style);

std::vector<FlowElement> layout_document(const Document& doc, const StyleConfig& style);

}  // namespace resume
