// compute_ssf <prices.csv> <definitions.txt> <output.csv> [--threads N] [--list] [--quiet]
//
// Writes one Super Smoother column per definition line, e.g.
//   SSF_20: SSF 20
//   SSF_E:  SSF 20 --everget --pi=3.141592653589793

#include "Logger.hpp"
#include "SsfBatch.hpp"
#include "SsfConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace ehlers;

int main(int argc, char** argv)
{
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0]
                  << " <prices.csv> <definitions.txt> <output.csv> [--threads N] [--list] [--quiet]\n";
        return 1;
    }

    unsigned threads = 0;
    bool list = false;
    bool quiet = false;
    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--threads" && i + 1 < argc) {
            threads = static_cast<unsigned>(std::max(0, std::atoi(argv[++i])));
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }
    Logger::SetVerbose(!quiet);
    if (quiet) {
        Logger::SetCallback([](const std::string&) {});
    }

    if (list) {
        auto config = read_ssf_config(argv[2]);
        if (!config.ok()) {
            std::cerr << "ERROR: " << config.status().ToString() << "\n";
            return 1;
        }
        for (const auto& definition : config->definitions) {
            std::cout << "  " << format_definition(definition) << "\n";
        }
    }

    ProgressCallback progress;
    if (!quiet) {
        progress = [](std::size_t done, std::size_t total, const std::string& name) {
            std::cout << "\r[" << done << "/" << total << "] " << name << "          " << std::flush;
        };
    }

    const SsfBatch batch(threads);
    const auto status = compute_ssf_file(argv[1], argv[2], argv[3], batch, progress);
    if (!quiet) {
        std::cout << "\n";
    }
    if (!status.ok()) {
        std::cerr << "ERROR: " << status.ToString() << "\n";
        return 1;
    }
    return 0;
}
