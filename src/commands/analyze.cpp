#include "commands/analyze.hpp"

#include "io/JsonIO.hpp"
#include "io/TextExtractor.hpp"
#include "orchestrator/MockOrchestratorClient.hpp"
#include "orchestrator/WebhookOrchestratorClient.hpp"
#include "resume/Errors.hpp"
#include "resume/PdfRenderer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;

    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid " + key + ": " + s);
    }
    if (used != s.size() || v <= 0) throw std::runtime_error("invalid " + key + ": " + s);
    return v;
}

static std::string read_upload(const fs::path& path, size_t max_bytes) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) throw std::runtime_error("Failed to open input file: " + path.string());

    // reject before reading the whole thing
    check_upload_size(static_cast<size_t>(size), max_bytes);

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open input file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// defaults < --config < environment < flags
static Settings resolve_settings(int argc, char** argv) {
    const std::string config_path = get_arg(argc, argv, "--config", "");
    Settings s = config_path.empty() ? Settings{} : loadSettings(config_path);
    applySettingsEnvironment(s);

    s.webhook_url = get_arg(argc, argv, "--webhook", s.webhook_url);
    s.timeout_seconds = get_arg_int(argc, argv, "--timeout", s.timeout_seconds);
    return s;
}

int cmd_analyze(int argc, char** argv) {
    const std::string file_path = get_arg(argc, argv, "--file", "");
    const bool adjust = has_flag(argc, argv, "--adjust");
    const std::string mock_dir = get_arg(argc, argv, "--mock", "");
    const std::string out_arg = get_arg(argc, argv, "--out", "");
    const std::string style_path = get_arg(argc, argv, "--style", "");

    if (file_path.empty()) {
        std::cerr << "[error] missing --file\n";
        return 1;
    }

    try {
        const Settings settings = resolve_settings(argc, argv);
        const std::string content_type = get_arg(argc, argv, "--content-type", guess_content_type(file_path));
        const std::string filename = fs::path(file_path).filename().string();

        std::cerr << "[info] received " << filename << " (" << content_type << ") | adjust="
                  << (adjust ? "true" : "false") << "\n";

        const std::string bytes = read_upload(file_path, settings.max_file_size_bytes());
        const std::string resume_text = extract_text_from_upload(bytes, content_type, filename);

        std::unique_ptr<orchestrator::OrchestratorClient> client;
        if (!mock_dir.empty()) {
            client = std::make_unique<orchestrator::MockOrchestratorClient>(mock_dir);
        } else {
            client = std::make_unique<orchestrator::WebhookOrchestratorClient>(settings.webhook_url,
                                                                               settings.timeout_seconds);
        }

        const orchestrator::OrchestratorResponse response = client->send_resume(resume_text, adjust);

        std::cout << "FILE: " << file_path << "\n";
        std::cout << "ADJUST: " << (adjust ? "on" : "off") << "\n";
        std::cout << "ORCHESTRATOR: " << (mock_dir.empty() ? settings.webhook_url : "mock:" + mock_dir) << "\n";

        if (adjust && !response.rewritten_resume.empty()) {
            const resume::StyleConfig style =
                style_path.empty() ? resume::StyleConfig{} : loadStyleConfig(style_path);
            const std::string name = resume::candidate_name_from_text(resume_text);

            std::optional<fs::path> out_path;
            if (!out_arg.empty()) out_path = fs::path(out_arg);

            const resume::PdfFile pdf = resume::write_resume_pdf(name, response.rewritten_resume, style, out_path);
            std::cout << "NAME: " << name << "\n";
            std::cout << "OUT_PDF: " << pdf.path.string() << "\n";
            std::cout << "PAGES: " << pdf.page_count << "\n";
            return 0;
        }

        const orchestrator::AnalysisResult result = orchestrator::make_analysis_result(response);
        const std::string body = result.to_json().dump(2);

        if (out_arg.empty()) {
            std::cout << "ANALYSIS: json\n" << body << "\n";
            return 0;
        }

        const fs::path out_path(out_arg);
        if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());
        std::ofstream out(out_path, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());
        out << body << "\n";

        std::cout << "OUT_JSON: " << out_path.string() << "\n";
        std::cout << "SCORE: " << (result.score ? std::to_string(*result.score) : "null") << "\n";
        return 0;
    } catch (const resume::ResumeError& e) {
        std::cerr << "[error] " << resume::kind_name(e.kind()) << ": " << e.what() << "\n";
        return resume::exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[error] analyze failed: " << e.what() << "\n";
        return 1;
    }
}
