#include "io/JsonIO.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using resume::Rgb;
using resume::StyleConfig;
using resume::TextAlign;
using resume::TextStyle;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string field_path(const std::string& where, const char* key) {
    return where + "." + std::string(key);
}

// Optional fields: absent keeps the default, present must have the right type.

static void read_number(const json& j, const char* key, const std::string& where, double& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(field_path(where, key) + " must be a number");
    }
    out = j.at(key).get<double>();
}

static void read_positive(const json& j, const char* key, const std::string& where, double& out) {
    double v = out;
    read_number(j, key, where, v);
    if (v <= 0.0) {
        throw std::runtime_error(field_path(where, key) + " must be positive");
    }
    out = v;
}

static void read_int(const json& j, const char* key, const std::string& where, int& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(field_path(where, key) + " must be an integer");
    }
    out = j.at(key).get<int>();
}

static void read_bool(const json& j, const char* key, const std::string& where, bool& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(field_path(where, key) + " must be a boolean");
    }
    out = j.at(key).get<bool>();
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    if (!j.contains(key)) return;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(field_path(where, key) + " must be a string");
    }
    out = j.at(key).get<std::string>();
}

static void read_color(const json& j, const char* key, const std::string& where, Rgb& out) {
    std::string hex;
    if (!j.contains(key)) return;
    read_string(j, key, where, hex);
    try {
        out = resume::rgb_from_hex(hex);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(field_path(where, key) + " must be a color like \"#1B2A4A\"");
    }
}

static void read_string_array(const json& j, const char* key, const std::string& where,
                              std::vector<std::string>& out) {
    if (!j.contains(key)) return;
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(field_path(where, key) + " must be an array");
    }
    std::vector<std::string> values;
    values.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        values.push_back(arr.at(i).get<std::string>());
    }
    out = std::move(values);
}

// Returns nullptr when the key is absent.
static const json* child_object(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return nullptr;
    require_object(j.at(key), field_path(where, key));
    return &j.at(key);
}

static void parseTextStyle(const json& j, const std::string& where, TextStyle& ts) {
    require_object(j, where);

    read_bool(j, "bold", where, ts.bold);
    read_bool(j, "italic", where, ts.italic);
    read_positive(j, "size", where, ts.size);
    read_positive(j, "leading", where, ts.leading);
    read_number(j, "space_before", where, ts.space_before);
    read_number(j, "space_after", where, ts.space_after);
    read_number(j, "left_indent", where, ts.left_indent);
    read_color(j, "color", where, ts.color);

    if (j.contains("align")) {
        std::string align;
        read_string(j, "align", where, align);
        if (align == "left") ts.align = TextAlign::Left;
        else if (align == "justify") ts.align = TextAlign::Justify;
        else throw std::runtime_error(where + ".align must be \"left\" or \"justify\"");
    }
}

static json readJsonFile(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

void applyStyleOverrides(const json& j, StyleConfig& style) {
    const std::string where = "style";
    require_object(j, where);

    read_string(j, "font_family", where, style.font_family);

    if (const json* page = child_object(j, "page", where)) {
        const std::string w = where + ".page";
        read_positive(*page, "width", w, style.page.width);
        read_positive(*page, "height", w, style.page.height);
        read_number(*page, "margin_top", w, style.page.margin_top);
        read_number(*page, "margin_bottom", w, style.page.margin_bottom);
        read_number(*page, "margin_left", w, style.page.margin_left);
        read_number(*page, "margin_right", w, style.page.margin_right);

        if (style.page.content_width() <= 0.0 || style.page.content_height() <= 0.0) {
            throw std::runtime_error(w + " margins leave no room for content");
        }
    }

    if (const json* palette = child_object(j, "palette", where)) {
        const std::string w = where + ".palette";
        read_color(*palette, "primary", w, style.palette.primary);
        read_color(*palette, "accent", w, style.palette.accent);
        read_color(*palette, "line", w, style.palette.line);
    }

    if (const json* roles = child_object(j, "roles", where)) {
        const std::string w = where + ".roles";
        const struct {
            const char* key;
            TextStyle* target;
        } role_table[] = {
            {"name", &style.name},
            {"contact", &style.contact},
            {"section_title", &style.section_title},
            {"body", &style.body},
            {"job_title", &style.job_title},
            {"bullet", &style.bullet},
            {"skill_item", &style.skill_item},
        };
        for (const auto& r : role_table) {
            if (roles->contains(r.key)) parseTextStyle(roles->at(r.key), field_path(w, r.key), *r.target);
        }
    }

    if (const json* header = child_object(j, "section_header", where)) {
        const std::string w = where + ".section_header";
        read_positive(*header, "height", w, style.section_header_height);
        read_number(*header, "space_before", w, style.section_header_space_before);
        read_number(*header, "space_after", w, style.section_header_space_after);
        read_number(*header, "title_baseline", w, style.section_title_baseline);
        read_number(*header, "rule_width", w, style.rule_width);
    }

    if (const json* marker = child_object(j, "bullet_marker", where)) {
        const std::string w = where + ".bullet_marker";
        read_number(*marker, "radius", w, style.bullet_radius);
        read_number(*marker, "center_x", w, style.bullet_center_x);
        read_number(*marker, "center_y", w, style.bullet_center_y);
    }

    if (const json* cols = child_object(j, "two_column", where)) {
        const std::string w = where + ".two_column";
        read_number(*cols, "gutter", w, style.column_gutter);
        read_number(*cols, "row_padding", w, style.row_padding);

        int min_items = static_cast<int>(style.two_column_min_items);
        read_int(*cols, "min_items", w, min_items);
        if (min_items < 1) throw std::runtime_error(w + ".min_items must be at least 1");
        style.two_column_min_items = static_cast<size_t>(min_items);

        read_string_array(*cols, "keywords", w, style.skills_keywords);
    }

    if (const json* meta = child_object(j, "metadata", where)) {
        const std::string w = where + ".metadata";
        read_string(*meta, "author", w, style.author);
        read_string(*meta, "creation_date", w, style.creation_date);
    }

    read_int(j, "max_pages", where, style.max_pages);
}

StyleConfig loadStyleConfig(const std::string& path) {
    StyleConfig style;
    applyStyleOverrides(readJsonFile(path, "style"), style);
    return style;
}

void applySettingsOverrides(const json& j, Settings& settings) {
    const std::string where = "settings";
    require_object(j, where);

    read_string(j, "webhook_url", where, settings.webhook_url);
    read_int(j, "timeout_seconds", where, settings.timeout_seconds);
    read_int(j, "max_file_size_mb", where, settings.max_file_size_mb);

    if (settings.timeout_seconds <= 0) throw std::runtime_error(where + ".timeout_seconds must be positive");
    if (settings.max_file_size_mb <= 0) throw std::runtime_error(where + ".max_file_size_mb must be positive");
}

Settings loadSettings(const std::string& path) {
    Settings settings;
    applySettingsOverrides(readJsonFile(path, "settings"), settings);
    return settings;
}

static int env_positive_int(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return fallback;

    char* end = nullptr;
    const long v = std::strtol(raw, &end, 10);
    if (*end != '\0' || v <= 0 || v > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string(name) + " must be a positive integer, got: " + raw);
    }
    return static_cast<int>(v);
}

void applySettingsEnvironment(Settings& settings) {
    if (const char* url = std::getenv("N8N_WEBHOOK_URL")) {
        if (*url) settings.webhook_url = url;
    }
    settings.timeout_seconds = env_positive_int("TIMEOUT_SECONDS", settings.timeout_seconds);
    settings.max_file_size_mb = env_positive_int("MAX_FILE_SIZE_MB", settings.max_file_size_mb);
}
