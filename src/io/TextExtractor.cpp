#include "io/TextExtractor.hpp"

#include "resume/Errors.hpp"
#include "text/TextUtil.hpp"

#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <vector>

using resume::ErrorKind;
using resume::ResumeError;

static const char* kNoPdfText = "could not extract text from the PDF; the file may contain only images";

void check_upload_size(size_t size, size_t max_bytes) {
    if (size <= max_bytes) return;

    const double limit_mb = static_cast<double>(max_bytes) / (1024.0 * 1024.0);
    const double got_mb = static_cast<double>(size) / (1024.0 * 1024.0);

    char buf[128];
    std::snprintf(buf, sizeof(buf), "file exceeds the limit of %.0f MB (received %.2f MB)", limit_mb, got_mb);
    throw ResumeError(ErrorKind::SizeLimit, buf);
}

std::string extract_text_from_pdf(const std::string& bytes) {
    std::vector<char> data(bytes.begin(), bytes.end());
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        data.data(), static_cast<int>(data.size())));

    if (!doc || doc->is_locked()) {
        throw ResumeError(ErrorKind::Validation, kNoPdfText);
    }

    std::string text;
    const int page_count = doc->pages();
    for (int i = 0; i < page_count; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            std::cerr << "[warn] could not open PDF page " << (i + 1) << ", skipping\n";
            continue;
        }

        const poppler::byte_array raw = page->text().to_utf8();
        const std::string page_text = textutil::trim(std::string(raw.begin(), raw.end()));
        if (page_text.empty()) continue;

        if (!text.empty()) text += "\n\n";
        text += page_text;
    }

    if (text.empty()) {
        throw ResumeError(ErrorKind::Validation, kNoPdfText);
    }
    return text;
}

std::string extract_text_from_plain(const std::string& bytes) {
    const std::string text = textutil::trim(textutil::make_valid_utf8(bytes));
    if (text.empty()) {
        throw ResumeError(ErrorKind::Validation, "the text file is empty");
    }
    return text;
}

std::string extract_text_from_upload(const std::string& bytes,
                                     const std::string& content_type,
                                     const std::string& filename) {
    if (content_type == "application/pdf" || textutil::ends_with_ci(filename, ".pdf")) {
        return extract_text_from_pdf(bytes);
    }

    if (textutil::starts_with(content_type, "text/") || textutil::ends_with_ci(filename, ".txt")) {
        return extract_text_from_plain(bytes);
    }

    throw ResumeError(ErrorKind::Validation,
                      "unsupported file type: " + content_type + ". Send a PDF or a plain-text (.txt) file.");
}

std::string guess_content_type(const std::string& filename) {
    if (textutil::ends_with_ci(filename, ".pdf")) return "application/pdf";
    if (textutil::ends_with_ci(filename, ".txt")) return "text/plain";
    return "application/octet-stream";
}
