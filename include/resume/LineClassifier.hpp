#pragma once

#include <string>

namespace resume {

enum class LineKind {
    Name,
    Contact,
    SectionHeader,
    Bullet,
    JobTitle,
    Paragraph
};

struct ClassifiedLine {
    LineKind kind = LineKind::Paragraph;
    std::string text;                // header title, bullet text without marker, or the line
    std::string inline_content;      // SectionHeader only: text after ':' when long enough
};

struct SectionTitle {
    std::string title;
    std::string inline_content;
};

enum class ParsePhase {
    ExpectName,
    ExpectContact,
    Body
};

struct LineContext {
    ParsePhase phase = ParsePhase::ExpectName;
    size_t contact_lines = 0;
    size_t max_contact_lines = 3;
    bool section_open = false;
};

// --- line predicates (input is a trimmed, non-empty line) ---

// ALL-CAPS title shorter than 60 chars, or a known section name
bool is_section_header(const std::string& line);

// accent/case-insensitive match against the curated section names
bool is_known_section_name(const std::string& title);

// "Tools: Git, Postman, VS Code" -> {"Tools", "Git, Postman, VS Code"}
// Content after ':' is only split off when longer than 10 chars.
SectionTitle split_section_title(const std::string& line);

bool is_bullet(const std::string& line);
std::string strip_bullet_marker(const std::string& line);

// e-mail, known keywords or a phone number pattern
bool is_contact_line(const std::string& line);

// Pure: evaluates the ordered rule table for the given context.
ClassifiedLine classify_line(const std::string& line, const LineContext& ctx);

// Stateful wrapper: ExpectName -> ExpectContact (bounded) -> Body.
class LineClassifier {
public:
    explicit LineClassifier(size_t max_contact_lines = 3);

    // line must be trimmed and non-empty
    ClassifiedLine classify(const std::string& line);

    const LineContext& context() const { return ctx_; }

private:
    LineContext ctx_;
};

}  // namespace resume
