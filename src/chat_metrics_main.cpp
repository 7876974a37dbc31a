// chat_metrics_main.cpp
// Console driver: loads a normalized conversation file, runs the
// quantitative engine and prints either the text report or the JSON.

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "json_io.hpp"
#include "quantitative.hpp"
#include "report.hpp"

static void printUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--json|--report] [--pretty] <conversation.json>\n"
              << "  --report   fixed-width text report (default)\n"
              << "  --json     full analysis as JSON\n"
              << "  --pretty   indent the JSON output\n";
}

// -------------------------------------------------------------
// Console entry point
// -------------------------------------------------------------
int console_main(int argc, char* argv[]) {
    bool asJson = false;
    bool pretty = false;
    std::string inputPath;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            asJson = true;
        } else if (arg == "--report") {
            asJson = false;
        } else if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else if (inputPath.empty()) {
            inputPath = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Conversation conversation;
        std::string error;
        if (!loadConversationFromJsonFile(inputPath, conversation, error)) {
            std::cerr << "ConversationLoader: " << error << "\n";
            return 1;
        }

        QuantitativeAnalysis analysis = computeQuantitativeAnalysis(conversation);

        if (asJson) {
            nlohmann::json j = analysis;
            std::cout << j.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        } else {
            std::cout << renderTextReport(conversation, analysis);
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

int main(int argc, char* argv[]) {
    return console_main(argc, argv);
}
