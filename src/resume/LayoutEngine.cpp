#include "resume/LayoutEngine.hpp"

#include "text/TextUtil.hpp"

#include <algorithm>
#include <cstddef>
#include <type_traits>

namespace resume {

StyleRole role_of(const FlowElement& e) {
    return std::visit([](const auto& el) -> StyleRole {
        using T = std::decay_t<decltype(el)>;
        if constexpr (std::is_same_v<T, TextElement>) return el.role;
        else if constexpr (std::is_same_v<T, SectionHeaderElement>) return StyleRole::SectionHeader;
        else if constexpr (std::is_same_v<T, BulletElement>) return StyleRole::Bullet;
        else return StyleRole::SkillItem;
    }, e);
}

const TextStyle& text_style_for(StyleRole role, const StyleConfig& style) {
    switch (role) {
        case StyleRole::Name: return style.name;
        case StyleRole::Contact: return style.contact;
        case StyleRole::SectionHeader: return style.section_title;
        case StyleRole::Bullet: return style.bullet;
        case StyleRole::JobTitle: return style.job_title;
        case StyleRole::SkillItem: return style.skill_item;
        case StyleRole::Body:
        default: return style.body;
    }
}

ColumnSplit balance_columns(const std::vector<std::string>& items) {
    const size_t mid = (items.size() + 1) / 2;

    ColumnSplit split;
    split.left.assign(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(mid));
    split.right.assign(items.begin() + static_cast<std::ptrdiff_t>(mid), items.end());
    return split;
}

std::vector<TwoColumnRow> pair_rows(const ColumnSplit& split) {
    const size_t rows = std::max(split.left.size(), split.right.size());

    std::vector<TwoColumnRow> out;
    out.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        TwoColumnRow r;
        if (i < split.left.size()) r.left = split.left[i];
        if (i < split.right.size()) r.right = split.right[i];
        out.push_back(std::move(r));
    }
    return out;
}

bool is_skills_title(const std::string& title, const StyleConfig& style) {
    const std::string folded = textutil::fold_lower(title);
    for (const auto& kw : style.skills_keywords) {
        if (!kw.empty() && folded.find(textutil::fold_lower(kw)) != std::string::npos) return true;
    }
    return false;
}

bool uses_two_columns(const SectionBlock& section, const StyleConfig& style) {
    if (section.items.empty() || section.items.size() < style.two_column_min_items) return false;
    if (!is_skills_title(section.title, style)) return false;
    for (const auto& it : section.items) {
        if (it.kind != ItemKind::Bullet) return false;
    }
    return true;
}

static void layout_section(const SectionBlock& s, const StyleConfig& style, std::vector<FlowElement>& out) {
    if (!s.title.empty()) {
        out.emplace_back(SectionHeaderElement{textutil::to_upper_text(s.title)});
    }

    if (uses_two_columns(s, style)) {
        std::vector<std::string> texts;
        texts.reserve(s.items.size());
        for (const auto& it : s.items) texts.push_back(it.text);

        for (auto& row : pair_rows(balance_columns(texts))) out.emplace_back(std::move(row));
        return;
    }

    for (const auto& it : s.items) {
        switch (it.kind) {
            case ItemKind::Bullet:
                out.emplace_back(BulletElement{it.text});
                break;
            case ItemKind::JobTitle:
                out.emplace_back(TextElement{StyleRole::JobTitle, it.text});
                break;
            case ItemKind::Paragraph:
                out.emplace_back(TextElement{StyleRole::Body, it.text});
                break;
        }
    }
}

std::vector<FlowElement> layout_document(const Document& doc, const StyleConfig& style) {
    std::vector<FlowElement> out;

    for (const auto& block : doc.blocks) {
        if (const auto* n = std::get_if<NameBlock>(&block)) {
            out.emplace_back(TextElement{StyleRole::Name, textutil::to_upper_text(n->content)});
        } else if (const auto* c = std::get_if<ContactBlock>(&block)) {
            out.emplace_back(TextElement{StyleRole::Contact, c->content});
        } else if (const auto* s = std::get_if<SectionBlock>(&block)) {
            layout_section(*s, style, out);
        }
    }

    return out;
}

}  // namespace resume
