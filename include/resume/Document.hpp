#pragma once

#include <string>
#include <variant>
#include <vector>

namespace resume {

enum class ItemKind {
    Paragraph,
    Bullet,
    JobTitle
};

struct Item {
    ItemKind kind = ItemKind::Paragraph;
    std::string text;
};

struct NameBlock {
    std::string content;
};

struct ContactBlock {
    std::string content;             // up to 3 lines joined with " | "
};

struct SectionBlock {
    std::string title;               // empty = implicit section
    std::vector<Item> items;
};

using Block = std::variant<NameBlock, ContactBlock, SectionBlock>;

// Blocks in the order they were recognized in the source text.
struct Document {
    std::vector<Block> blocks;
};

const char* item_kind_str(ItemKind k);

}  // namespace resume
