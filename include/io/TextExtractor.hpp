#pragma once

#include <cstddef>
#include <string>

// Throws ResumeError(SizeLimit) when size > max_bytes.
void check_upload_size(size_t size, size_t max_bytes);

// PDF (by content type or .pdf name) via poppler, or plain UTF-8 text.
// Throws ResumeError(Validation) for unsupported types or when no text comes out.
std::string extract_text_from_upload(const std::string& bytes,
                                     const std::string& content_type,
                                     const std::string& filename);

std::string extract_text_from_pdf(const std::string& bytes);
std::string extract_text_from_plain(const std::string& bytes);

// ".pdf" -> application/pdf, ".txt" -> text/plain, else application/octet-stream
std::string guess_content_type(const std::string& filename);
