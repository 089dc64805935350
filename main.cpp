#include "parser/Parser.hpp"
#include "adapter/HarAdapter.hpp"
#include "include/Errors.hpp"
#include "logger/Logger.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char *program) {
    std::cerr << "Usage: " << program
              << " [--loose] [--keep] [--verbose] <file.har> <METHOD> <URL> [\"Name: value\" ...] [--body <text>]\n"
              << "  --loose    match on method and URL only\n"
              << "  --keep     do not consume matched entries\n"
              << "  --verbose  print matching diagnostics\n";
}

}

int main(int argc, char *argv[]) {
    ReplayConfig config;
    bool verbose = false;
    std::vector<std::string> positional;
    RequestSnapshot request;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--loose") {
            config.strict_matching = false;
        } else if (arg == "--keep") {
            config.delete_after_match = false;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--body") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            request.body = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 3) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::setLevel(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    const std::string &harFile = positional[0];
    request.method = positional[1];
    request.url = positional[2];
    for (size_t i = 3; i < positional.size(); ++i) {
        const auto colon = positional[i].find(':');
        if (colon == std::string::npos) {
            std::cerr << "Bad header (expected \"Name: value\"): " << positional[i] << "\n";
            return 1;
        }
        std::string value = positional[i].substr(colon + 1);
        if (!value.empty() && value.front() == ' ') value.erase(0, 1);
        request.headers.push_back({positional[i].substr(0, colon), value});
    }

    Parser parser;
    if (!parser.loadHarFile(harFile)) {
        std::cerr << "Failed to load HAR file: " << harFile << "\n";
        return 1;
    }

    HarAdapter adapter(parser.getCapture(), config);
    try {
        const ResponseSnapshot response = adapter.send(request);
        std::cout << response.status << " " << response.status_text << "\n";
        for (const auto &h : response.headers) {
            std::cout << h.name << ": " << h.value << "\n";
        }
        if (!response.redirect_url.empty()) {
            std::cout << "Redirect: " << response.redirect_url << "\n";
        }
        std::cout << "\n" << response.body << "\n";
    } catch (const NoMatchFound &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
