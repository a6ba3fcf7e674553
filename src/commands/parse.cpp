#include "commands/parse.hpp"

#include "resume/DocumentArtifact.hpp"
#include "resume/DocumentBuilder.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
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

int cmd_parse(int argc, char** argv) {
    const std::string in_path = get_arg(argc, argv, "--in", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");

    if (in_path.empty()) {
        std::cerr << "[error] missing --in\n";
        return 1;
    }

    try {
        std::ifstream in(in_path, std::ios::in | std::ios::binary);
        if (!in) throw std::runtime_error("Failed to open input file: " + in_path);
        std::ostringstream ss;
        ss << in.rdbuf();

        const resume::Document doc = resume::parse_resume(ss.str());

        if (out_path.empty()) {
            std::cout << resume::document_to_json(doc).dump(2) << "\n";
            return 0;
        }

        resume::write_document_json(out_path, doc);
        std::cout << "IN: " << in_path << "\n";
        std::cout << "OUT_JSON: " << out_path << "\n";
        std::cout << "BLOCKS: " << doc.blocks.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[error] parse failed: " << e.what() << "\n";
        return 1;
    }
}
