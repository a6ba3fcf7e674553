#include "commands/analyze.hpp"
#include "commands/parse.hpp"
#include "commands/render.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-formatter render --in <txt> [options]\n"
        << "  resume-formatter parse --in <txt> [--out <json>]\n"
        << "  resume-formatter analyze --file <pdf|txt> [options]\n"
        << "  resume-formatter help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  resume-formatter render --in <txt> [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  plain-text resume (required)\n"
        << "  --name <str>                 default: first line when shorter than 60 chars\n"
        << "  --out <path>                 default: temp dir resume_XXXXXX.pdf\n"
        << "  --style <path>               JSON style overrides\n";
    return 0;
}

static int print_parse_help() {
    std::cerr
        << "usage:\n"
        << "  resume-formatter parse --in <txt> [--out <json>]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  plain-text resume (required)\n"
        << "  --out <path>                 default: print to stdout\n";
    return 0;
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  resume-formatter analyze --file <pdf|txt> [options]\n"
        << "\n"
        << "input:\n"
        << "  --file <path>                resume upload (required)\n"
        << "  --content-type <mime>        default: guessed from the extension\n"
        << "  --adjust                     ask for a rewritten resume and render it to PDF\n"
        << "\n"
        << "orchestrator:\n"
        << "  --config <path>              JSON settings (webhook_url, timeout_seconds, max_file_size_mb)\n"
        << "  --webhook <url>              overrides N8N_WEBHOOK_URL\n"
        << "  --timeout <s>                overrides TIMEOUT_SECONDS, default: 120\n"
        << "  --mock <dir>                 replay <dir>/analyze.json or <dir>/adjust.json\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 PDF path (--adjust) or analysis JSON path\n"
        << "  --style <path>               JSON style overrides for the PDF\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    const bool wants_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "render"  && wants_help) return print_render_help();
    if (cmd == "parse"   && wants_help) return print_parse_help();
    if (cmd == "analyze" && wants_help) return print_analyze_help();

    if (cmd == "render")  return cmd_render(argc - 1, argv + 1);
    if (cmd == "parse")   return cmd_parse(argc - 1, argv + 1);
    if (cmd == "analyze") return cmd_analyze(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
