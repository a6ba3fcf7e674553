#include "resume/Document.hpp"

namespace resume {

const char* item_kind_str(ItemKind k) {
    switch (k) {
        case ItemKind::Paragraph: return "paragraph";
        case ItemKind::Bullet: return "bullet";
        case ItemKind::JobTitle: return "job_title";
        default: return "unknown";
    }
}

}  // namespace resume
