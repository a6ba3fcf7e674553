#include <gtest/gtest.h>

#include "resume/DocumentArtifact.hpp"
#include "resume/DocumentBuilder.hpp"

#include <string>
#include <variant>

using namespace resume;

class DocumentBuilderTest : public ::testing::Test {
protected:
    static const SectionBlock& section_at(const Document& doc, size_t i) {
        return std::get<SectionBlock>(doc.blocks.at(i));
    }
};

// ==================== scenarios ====================

TEST_F(DocumentBuilderTest, NameContactAndBulletedSection) {
    const Document doc = parse_resume("John Doe\njohn@mail.com\nEXPERIENCE\n- Built X\n- Built Y");

    ASSERT_EQ(doc.blocks.size(), 3u);
    EXPECT_EQ(std::get<NameBlock>(doc.blocks[0]).content, "John Doe");
    EXPECT_EQ(std::get<ContactBlock>(doc.blocks[1]).content, "john@mail.com");

    const SectionBlock& s = section_at(doc, 2);
    EXPECT_EQ(s.title, "EXPERIENCE");
    ASSERT_EQ(s.items.size(), 2u);
    EXPECT_EQ(s.items[0].kind, ItemKind::Bullet);
    EXPECT_EQ(s.items[0].text, "Built X");
    EXPECT_EQ(s.items[1].kind, ItemKind::Bullet);
    EXPECT_EQ(s.items[1].text, "Built Y");
}

TEST_F(DocumentBuilderTest, InlineHeaderContentBecomesParagraph) {
    const Document doc = parse_resume("John Doe\nSkills: Python, Go, Rust, C++, Java");

    ASSERT_EQ(doc.blocks.size(), 2u);
    const SectionBlock& s = section_at(doc, 1);
    EXPECT_EQ(s.title, "Skills");
    ASSERT_EQ(s.items.size(), 1u);
    EXPECT_EQ(s.items[0].kind, ItemKind::Paragraph);
    EXPECT_EQ(s.items[0].text, "Python, Go, Rust, C++, Java");
}

TEST_F(DocumentBuilderTest, BulletBeforeAnyHeaderOpensImplicitSection) {
    const Document doc = parse_resume("John Doe\n- Led a team");

    ASSERT_EQ(doc.blocks.size(), 2u);
    const SectionBlock& s = section_at(doc, 1);
    EXPECT_EQ(s.title, "");
    ASSERT_EQ(s.items.size(), 1u);
    EXPECT_EQ(s.items[0].kind, ItemKind::Bullet);
    EXPECT_EQ(s.items[0].text, "Led a team");
}

// ==================== edge cases ====================

TEST_F(DocumentBuilderTest, EmptyInputGivesEmptyDocument) {
    EXPECT_TRUE(parse_resume("").blocks.empty());
    EXPECT_TRUE(parse_resume("\n\n   \n\t\n").blocks.empty());
}

TEST_F(DocumentBuilderTest, SingleLineIsJustAName) {
    const Document doc = parse_resume("  Maria Silva  ");
    ASSERT_EQ(doc.blocks.size(), 1u);
    EXPECT_EQ(std::get<NameBlock>(doc.blocks[0]).content, "Maria Silva");
}

TEST_F(DocumentBuilderTest, ContactAbsorptionIsBoundedToThreeLines) {
    const Document doc = parse_resume(
        "Jane Roe\njane@mail.com\n(11) 98765-4321\nSao Paulo, SP\nRemote friendly\nAvailable now");

    ASSERT_EQ(doc.blocks.size(), 3u);
    EXPECT_EQ(std::get<ContactBlock>(doc.blocks[1]).content,
              "jane@mail.com | (11) 98765-4321 | Sao Paulo, SP");

    const SectionBlock& s = section_at(doc, 2);
    EXPECT_EQ(s.title, "");
    ASSERT_EQ(s.items.size(), 2u);
    EXPECT_EQ(s.items[0].text, "Remote friendly");
    EXPECT_EQ(s.items[1].text, "Available now");
}

TEST_F(DocumentBuilderTest, NoContactAfterFirstSection) {
    const Document doc = parse_resume("Jane Roe\nSUMMARY\njane@mail.com");

    ASSERT_EQ(doc.blocks.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SectionBlock>(doc.blocks[1]));
    EXPECT_EQ(section_at(doc, 1).items.at(0).text, "jane@mail.com");
}

TEST_F(DocumentBuilderTest, ShortCapsLineIsHeaderOnceContactPhaseEnds) {
    const Document doc = parse_resume("Jane Roe\na@b.com\nline two\nline three\nGITHUB.COM/JANE");

    ASSERT_EQ(doc.blocks.size(), 3u);
    EXPECT_EQ(section_at(doc, 2).title, "GITHUB.COM/JANE");
    EXPECT_TRUE(section_at(doc, 2).items.empty());
}

TEST_F(DocumentBuilderTest, JobTitlesAndParagraphsInsideSection) {
    const Document doc = parse_resume(
        "Jane Roe\njane@mail.com\n\nEXPERI\xC3\x8A" "NCIA PROFISSIONAL\n"
        "Engenheira de Software | ACME | 2020 - 2024\n"
        "\xE2\x80\xA2 Reduziu a lat\xC3\xAAncia em 40%\n"
        "Responsavel pela plataforma de pagamentos.");

    ASSERT_EQ(doc.blocks.size(), 3u);
    const SectionBlock& s = section_at(doc, 2);
    EXPECT_EQ(s.title, "EXPERI\xC3\x8A" "NCIA PROFISSIONAL");
    ASSERT_EQ(s.items.size(), 3u);
    EXPECT_EQ(s.items[0].kind, ItemKind::JobTitle);
    EXPECT_EQ(s.items[1].kind, ItemKind::Bullet);
    EXPECT_EQ(s.items[1].text, "Reduziu a lat\xC3\xAAncia em 40%");
    EXPECT_EQ(s.items[2].kind, ItemKind::Paragraph);
}

TEST_F(DocumentBuilderTest, TypographicInputIsSanitizedFirst) {
    const Document doc = parse_resume("\xEF\xBB\xBFJane Roe\nEDUCATION\n\xE2\x80\x93 BSc \xE2\x80\x9CHonors\xE2\x80\x9D");

    EXPECT_EQ(std::get<NameBlock>(doc.blocks.at(0)).content, "Jane Roe");
    EXPECT_EQ(section_at(doc, 1).items.at(0).text, "BSc \"Honors\"");
}

TEST_F(DocumentBuilderTest, BlockOrderFollowsSource) {
    const Document doc = parse_resume("Jane Roe\nEDUCATION\n- BSc\nPROJECTS\n- Cache\nEDUCATION\n- MSc");

    ASSERT_EQ(doc.blocks.size(), 4u);
    EXPECT_EQ(section_at(doc, 1).title, "EDUCATION");
    EXPECT_EQ(section_at(doc, 2).title, "PROJECTS");
    EXPECT_EQ(section_at(doc, 3).title, "EDUCATION");
    EXPECT_EQ(section_at(doc, 3).items.at(0).text, "MSc");
}

// ==================== dump artifact ====================

TEST_F(DocumentBuilderTest, DocumentToJson) {
    const Document doc = parse_resume("John Doe\njohn@mail.com\nEXPERIENCE\n- Built X");
    const nlohmann::json j = document_to_json(doc);

    ASSERT_TRUE(j.contains("blocks"));
    ASSERT_EQ(j["blocks"].size(), 3u);
    EXPECT_EQ(j["blocks"][0]["type"], "name");
    EXPECT_EQ(j["blocks"][1]["type"], "contact");
    EXPECT_EQ(j["blocks"][2]["type"], "section");
    EXPECT_EQ(j["blocks"][2]["title"], "EXPERIENCE");
    EXPECT_EQ(j["blocks"][2]["items"][0]["type"], "bullet");
    EXPECT_EQ(j["blocks"][2]["items"][0]["text"], "Built X");
}

TEST_F(DocumentBuilderTest, Latin1InputStillDumps) {
    const Document doc = parse_resume("Jos\xE9 Silva\nEXPERIENCE\n- Built X");

    ASSERT_EQ(doc.blocks.size(), 2u);
    EXPECT_EQ(std::get<NameBlock>(doc.blocks[0]).content, "Jos\xEF\xBF\xBD Silva");

    std::string dumped;
    EXPECT_NO_THROW(dumped = document_to_json(doc).dump(2));
    EXPECT_NE(dumped.find("Built X"), std::string::npos);
}
