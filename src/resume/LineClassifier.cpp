#include "resume/LineClassifier.hpp"

#include "text/TextUtil.hpp"

#include <cctype>
#include <regex>

namespace resume {

static constexpr size_t kMaxHeaderLength = 60;
static constexpr size_t kMaxShortLineLength = 120;
static constexpr size_t kMinInlineContentLength = 10;

// Folded (lowercase, unaccented) names. A name must cover the whole title;
// only a tail without letters ("Skills (2)", "Projects -") may follow it.
static const char* const kSectionNames[] = {
    // English
    "summary", "professional summary", "profile",
    "experience", "professional experience", "work experience", "employment history",
    "education", "academic background",
    "skills", "technical skills", "competencies", "core competencies",
    "software", "softwares", "tools",
    "languages",
    "certifications", "certificates",
    "courses",
    "projects",
    "objective",
    "additional info", "additional information", "personal information",
    "links", "link",
    "references",
    "activities",
    "volunteer work", "volunteering",
    // Portuguese
    "resumo profissional", "resume profissional",
    "experiencia profissional",
    "formacao academica",
    "habilidades",
    "competencias",
    "ferramentas",
    "idiomas",
    "certificacoes",
    "cursos",
    "projetos",
    "objetivo",
    "informacoes adicionais", "informacoes pessoais", "informacoes complementares",
    "informacao adicional", "informacao pessoal",
    "referencias",
    "atividades",
    "trabalho voluntario", "trabalhos voluntarios",
};

static const char* const kContactKeywords[] = {
    "@", "linkedin", "github", "telefone", "tel:", "fone:", "celular"
};

static const char* const kBulletMarkers[] = {
    "-", "*",
    "\xE2\x80\xA2",  // •
    "\xE2\x80\x93",  // –
    "\xE2\x80\x94",  // —
    "\xE2\x96\xBA",  // ►
    "\xE2\x96\xAA",  // ▪
    "\xE2\x97\x8F",  // ●
};

static std::string header_title_part(const std::string& line) {
    const size_t colon = line.find(':');
    std::string title = (colon == std::string::npos) ? line : textutil::trim(line.substr(0, colon));
    while (!title.empty() && title.back() == ':') title.pop_back();
    return title;
}

static bool has_letter(const std::string& s) {
    for (char c : s) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalpha(u)) return true;
    }
    return false;
}

bool is_known_section_name(const std::string& title) {
    if (textutil::utf8_length(title) >= kMaxHeaderLength) return false;

    const std::string t = textutil::collapse_spaces(textutil::fold_lower(title));
    for (const char* name : kSectionNames) {
        const std::string n(name);
        if (!textutil::starts_with(t, n)) continue;
        if (!has_letter(t.substr(n.size()))) return true;
    }
    return false;
}

bool is_section_header(const std::string& line) {
    const std::string title = header_title_part(textutil::trim(line));
    if (title.empty()) return false;
    if (textutil::is_upper_text(title) && textutil::utf8_length(title) < kMaxHeaderLength) return true;
    return is_known_section_name(title);
}

SectionTitle split_section_title(const std::string& line) {
    const std::string stripped = textutil::trim(line);

    const size_t colon = stripped.find(':');
    if (colon != std::string::npos) {
        std::string title = textutil::trim(stripped.substr(0, colon));
        std::string content = textutil::trim(stripped.substr(colon + 1));
        if (textutil::utf8_length(content) > kMinInlineContentLength) {
            return SectionTitle{title, content};
        }
    }

    std::string title = stripped;
    while (!title.empty() && title.back() == ':') title.pop_back();
    return SectionTitle{title, ""};
}

static size_t bullet_marker_length(const std::string& line) {
    for (const char* m : kBulletMarkers) {
        if (textutil::starts_with(line, m)) return std::char_traits<char>::length(m);
    }
    return 0;
}

bool is_bullet(const std::string& line) {
    return bullet_marker_length(textutil::trim(line)) > 0;
}

std::string strip_bullet_marker(const std::string& line) {
    const std::string stripped = textutil::trim(line);
    const size_t n = bullet_marker_length(stripped);
    return textutil::trim(stripped.substr(n));
}

bool is_contact_line(const std::string& line) {
    const std::string lower = textutil::fold_lower(line);
    for (const char* kw : kContactKeywords) {
        if (lower.find(kw) != std::string::npos) return true;
    }

    // "(11) 98765-4321" or "+55 11 98765 4321"
    static const std::regex phone(
        R"(\(\d{2,3}\)\s*\d{4,5}|\+\d{1,3}[\s.-]?\(?\d{1,4}\)?[\s.-]?\d{3,5}[\s.-]?\d{3,5})");
    return std::regex_search(line, phone);
}

// ---------- ordered rule tables ----------

using LinePredicate = bool (*)(const std::string& line, const LineContext& ctx);

struct ClassificationRule {
    LineKind kind;
    LinePredicate matches;
};

static bool rule_contact_marker(const std::string& line, const LineContext&) {
    return is_contact_line(line);
}

static bool rule_short_unmarked(const std::string& line, const LineContext&) {
    return !is_section_header(line) && !is_bullet(line) &&
           textutil::utf8_length(line) < kMaxShortLineLength;
}

static bool rule_header(const std::string& line, const LineContext&) {
    return is_section_header(line);
}

static bool rule_bullet(const std::string& line, const LineContext&) {
    return is_bullet(line);
}

static bool rule_job_title(const std::string& line, const LineContext& ctx) {
    return ctx.section_open && line.find('|') != std::string::npos &&
           textutil::utf8_length(line) < kMaxShortLineLength;
}

static bool rule_any(const std::string&, const LineContext&) {
    return true;
}

// Contact phase: an explicit marker wins over the header check.
static const ClassificationRule kContactRules[] = {
    {LineKind::Contact, rule_contact_marker},
    {LineKind::Contact, rule_short_unmarked},
};

static const ClassificationRule kBodyRules[] = {
    {LineKind::SectionHeader, rule_header},
    {LineKind::Bullet, rule_bullet},
    {LineKind::JobTitle, rule_job_title},
    {LineKind::Paragraph, rule_any},
};

static ClassifiedLine make_line(LineKind kind, const std::string& line) {
    ClassifiedLine out;
    out.kind = kind;

    switch (kind) {
        case LineKind::SectionHeader: {
            SectionTitle st = split_section_title(line);
            out.text = std::move(st.title);
            out.inline_content = std::move(st.inline_content);
            break;
        }
        case LineKind::Bullet:
            out.text = strip_bullet_marker(line);
            break;
        default:
            out.text = line;
            break;
    }

    return out;
}

static bool contact_phase_open(const LineContext& ctx) {
    return ctx.phase == ParsePhase::ExpectContact &&
           ctx.contact_lines < ctx.max_contact_lines &&
           !ctx.section_open;
}

ClassifiedLine classify_line(const std::string& line, const LineContext& ctx) {
    if (ctx.phase == ParsePhase::ExpectName) return make_line(LineKind::Name, line);

    if (contact_phase_open(ctx)) {
        for (const auto& rule : kContactRules) {
            if (rule.matches(line, ctx)) return make_line(rule.kind, line);
        }
    }

    for (const auto& rule : kBodyRules) {
        if (rule.matches(line, ctx)) return make_line(rule.kind, line);
    }

    return make_line(LineKind::Paragraph, line);
}

LineClassifier::LineClassifier(size_t max_contact_lines) {
    ctx_.max_contact_lines = max_contact_lines;
}

ClassifiedLine LineClassifier::classify(const std::string& line) {
    ClassifiedLine out = classify_line(line, ctx_);

    switch (out.kind) {
        case LineKind::Name:
            ctx_.phase = ParsePhase::ExpectContact;
            break;
        case LineKind::Contact:
            ++ctx_.contact_lines;
            if (ctx_.contact_lines >= ctx_.max_contact_lines) ctx_.phase = ParsePhase::Body;
            break;
        default:
            // every body line lands in a section (explicit or implicit)
            ctx_.phase = ParsePhase::Body;
            ctx_.section_open = true;
            break;
    }

    return out;
}

}  // namespace resume
