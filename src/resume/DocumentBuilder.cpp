#include "resume/DocumentBuilder.hpp"

#include "text/TextUtil.hpp"

#include <utility>

namespace resume {

static const char* const kContactSeparator = " | ";

void DocumentBuilder::flush_contact() {
    if (contact_lines_.empty()) return;

    std::string joined;
    for (size_t i = 0; i < contact_lines_.size(); ++i) {
        if (i) joined += kContactSeparator;
        joined += contact_lines_[i];
    }
    doc_.blocks.push_back(ContactBlock{std::move(joined)});
    contact_lines_.clear();
}

SectionBlock& DocumentBuilder::open_section(const std::string& title) {
    doc_.blocks.push_back(SectionBlock{title, {}});
    current_section_ = doc_.blocks.size() - 1;
    return std::get<SectionBlock>(doc_.blocks.back());
}

SectionBlock& DocumentBuilder::current_section() {
    if (!current_section_) return open_section("");
    return std::get<SectionBlock>(doc_.blocks[*current_section_]);
}

void DocumentBuilder::append_item(ItemKind kind, const std::string& text) {
    current_section().items.push_back(Item{kind, text});
}

void DocumentBuilder::add(const ClassifiedLine& line) {
    if (line.kind == LineKind::Contact) {
        contact_lines_.push_back(line.text);
        return;
    }

    // the contact block sits right after the name, so it closes at the first other line
    if (line.kind != LineKind::Name) flush_contact();

    switch (line.kind) {
        case LineKind::Name:
            doc_.blocks.push_back(NameBlock{line.text});
            break;
        case LineKind::SectionHeader: {
            SectionBlock& s = open_section(line.text);
            if (!line.inline_content.empty()) {
                s.items.push_back(Item{ItemKind::Paragraph, line.inline_content});
            }
            break;
        }
        case LineKind::Bullet:
            append_item(ItemKind::Bullet, line.text);
            break;
        case LineKind::JobTitle:
            append_item(ItemKind::JobTitle, line.text);
            break;
        case LineKind::Paragraph:
            append_item(ItemKind::Paragraph, line.text);
            break;
        case LineKind::Contact:
            break;
    }
}

Document DocumentBuilder::finish() {
    flush_contact();
    current_section_.reset();
    return std::move(doc_);
}

Document parse_resume(const std::string& text) {
    const std::string clean = textutil::sanitize(text);

    LineClassifier classifier;
    DocumentBuilder builder;

    for (const auto& line : textutil::split_lines(clean)) {
        if (line.empty()) continue;
        builder.add(classifier.classify(line));
    }

    return builder.finish();
}

}  // namespace resume
