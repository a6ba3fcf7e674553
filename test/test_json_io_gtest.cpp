#include <gtest/gtest.h>

#include "io/JsonIO.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

using resume::StyleConfig;
using resume::TextAlign;

class JsonIOTest : public ::testing::Test {
protected:
    testutil::TempDir dir{"resume_formatter_jsonio"};

    void TearDown() override {
        unsetenv("N8N_WEBHOOK_URL");
        unsetenv("TIMEOUT_SECONDS");
        unsetenv("MAX_FILE_SIZE_MB");
    }

    static std::string error_of(const nlohmann::json& j) {
        StyleConfig style;
        try {
            applyStyleOverrides(j, style);
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return "";
    }
};

// ==================== style ====================

TEST_F(JsonIOTest, EmptyObjectKeepsDefaults) {
    const StyleConfig style = loadStyleConfig(dir.write("style.json", "{}").string());
    const StyleConfig defaults;

    EXPECT_DOUBLE_EQ(style.page.width, defaults.page.width);
    EXPECT_DOUBLE_EQ(style.page.margin_left, defaults.page.margin_left);
    EXPECT_EQ(style.font_family, "Helvetica");
    EXPECT_EQ(style.two_column_min_items, 4u);
    EXPECT_EQ(style.max_pages, 500);
}

TEST_F(JsonIOTest, PartialOverrides) {
    const auto path = dir.write("style.json", R"({
        "font_family": "DejaVu Sans",
        "page": {"margin_left": 40, "margin_right": 40},
        "palette": {"primary": "#FF0000"},
        "roles": {"body": {"size": 11, "align": "left"}, "name": {"color": "#000000"}},
        "two_column": {"min_items": 6, "keywords": ["stack"]},
        "metadata": {"author": "ACME HR"},
        "max_pages": 3,
        "unknown_key": true
    })");

    const StyleConfig style = loadStyleConfig(path.string());

    EXPECT_EQ(style.font_family, "DejaVu Sans");
    EXPECT_DOUBLE_EQ(style.page.margin_left, 40.0);
    EXPECT_DOUBLE_EQ(style.page.margin_top, StyleConfig{}.page.margin_top);
    EXPECT_DOUBLE_EQ(style.palette.primary.r, 1.0);
    EXPECT_DOUBLE_EQ(style.palette.primary.g, 0.0);
    EXPECT_DOUBLE_EQ(style.body.size, 11.0);
    EXPECT_EQ(style.body.align, TextAlign::Left);
    EXPECT_DOUBLE_EQ(style.body.leading, StyleConfig{}.body.leading);
    EXPECT_DOUBLE_EQ(style.name.color.r, 0.0);
    EXPECT_TRUE(style.name.bold);
    EXPECT_EQ(style.two_column_min_items, 6u);
    ASSERT_EQ(style.skills_keywords.size(), 1u);
    EXPECT_EQ(style.skills_keywords[0], "stack");
    EXPECT_EQ(style.author, "ACME HR");
    EXPECT_EQ(style.max_pages, 3);
}

TEST_F(JsonIOTest, WrongTypesNameTheField) {
    EXPECT_EQ(error_of({{"page", {{"margin_left", "2cm"}}}}), "style.page.margin_left must be a number");
    EXPECT_EQ(error_of({{"roles", {{"bullet", {{"bold", 1}}}}}}), "style.roles.bullet.bold must be a boolean");
    EXPECT_EQ(error_of({{"palette", {{"accent", "navy"}}}}),
              "style.palette.accent must be a color like \"#1B2A4A\"");
    EXPECT_EQ(error_of({{"two_column", {{"keywords", nlohmann::json::array({"a", 2})}}}}), "style.two_column.keywords[1] must be a string");
    EXPECT_EQ(error_of({{"roles", {{"body", {{"align", "center"}}}}}}),
              "style.roles.body.align must be \"left\" or \"justify\"");
    EXPECT_EQ(error_of({{"page", 5}}), "style.page must be an object");
    EXPECT_EQ(error_of({{"max_pages", 2.5}}), "style.max_pages must be an integer");
    EXPECT_EQ(error_of(nlohmann::json::array()), "style must be an object");
}

TEST_F(JsonIOTest, MarginsMustLeaveRoom) {
    EXPECT_EQ(error_of({{"page", {{"margin_left", 300}, {"margin_right", 300}}}}),
              "style.page margins leave no room for content");
}

TEST_F(JsonIOTest, MissingAndBrokenFiles) {
    EXPECT_THROW(loadStyleConfig((dir.path() / "nope.json").string()), std::runtime_error);
    EXPECT_THROW(loadStyleConfig(dir.write("bad.json", "{not json").string()), std::runtime_error);
}

// ==================== settings ====================

TEST_F(JsonIOTest, SettingsDefaults) {
    const Settings s;
    EXPECT_EQ(s.timeout_seconds, 120);
    EXPECT_EQ(s.max_file_size_mb, 5);
    EXPECT_EQ(s.max_file_size_bytes(), 5u * 1024 * 1024);
}

TEST_F(JsonIOTest, SettingsFileThenEnvironment) {
    const auto path = dir.write("settings.json",
                                R"({"webhook_url": "http://n8n:5678/webhook/cv", "timeout_seconds": 30})");
    Settings s = loadSettings(path.string());
    EXPECT_EQ(s.webhook_url, "http://n8n:5678/webhook/cv");
    EXPECT_EQ(s.timeout_seconds, 30);
    EXPECT_EQ(s.max_file_size_mb, 5);

    setenv("TIMEOUT_SECONDS", "45", 1);
    setenv("MAX_FILE_SIZE_MB", "2", 1);
    applySettingsEnvironment(s);
    EXPECT_EQ(s.webhook_url, "http://n8n:5678/webhook/cv");
    EXPECT_EQ(s.timeout_seconds, 45);
    EXPECT_EQ(s.max_file_size_mb, 2);

    setenv("N8N_WEBHOOK_URL", "http://other/hook", 1);
    applySettingsEnvironment(s);
    EXPECT_EQ(s.webhook_url, "http://other/hook");
}

TEST_F(JsonIOTest, InvalidEnvironmentValue) {
    Settings s;
    setenv("TIMEOUT_SECONDS", "soon", 1);
    EXPECT_THROW(applySettingsEnvironment(s), std::runtime_error);
    setenv("TIMEOUT_SECONDS", "-4", 1);
    EXPECT_THROW(applySettingsEnvironment(s), std::runtime_error);
}

TEST_F(JsonIOTest, SettingsRejectNonPositive) {
    Settings s;
    EXPECT_THROW(applySettingsOverrides({{"max_file_size_mb", 0}}, s), std::runtime_error);
    EXPECT_THROW(applySettingsOverrides({{"timeout_seconds", "120"}}, s), std::runtime_error);
}
