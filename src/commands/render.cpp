#include "commands/render.hpp"

#include "io/JsonIO.hpp"
#include "resume/DocumentBuilder.hpp"
#include "resume/Errors.hpp"
#include "resume/PdfRenderer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::string read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open input file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int cmd_render(int argc, char** argv) {
    const std::string in_path = get_arg(argc, argv, "--in", "");
    const std::string name_arg = get_arg(argc, argv, "--name", "");
    const std::string out_arg = get_arg(argc, argv, "--out", "");
    const std::string style_path = get_arg(argc, argv, "--style", "");

    if (in_path.empty()) {
        std::cerr << "[error] missing --in\n";
        return 1;
    }

    try {
        const resume::StyleConfig style = style_path.empty() ? resume::StyleConfig{} : loadStyleConfig(style_path);
        const std::string text = read_text_file(in_path);
        const std::string name = name_arg.empty() ? resume::candidate_name_from_text(text) : name_arg;

        std::optional<fs::path> out_path;
        if (!out_arg.empty()) out_path = fs::path(out_arg);

        const resume::PdfFile pdf = resume::write_resume_pdf(name, text, style, out_path);
        const resume::Document doc = resume::parse_resume(text);

        std::cout << "IN: " << in_path << "\n";
        std::cout << "NAME: " << name << "\n";
        std::cout << "OUT_PDF: " << pdf.path.string() << "\n";
        std::cout << "PAGES: " << pdf.page_count << "\n";
        std::cout << "BLOCKS: " << doc.blocks.size() << "\n";
        return 0;
    } catch (const resume::ResumeError& e) {
        std::cerr << "[error] " << resume::kind_name(e.kind()) << ": " << e.what() << "\n";
        return resume::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[error] render failed: " << e.what() << "\n";
        return 1;
    }
}
