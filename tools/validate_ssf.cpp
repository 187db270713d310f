#include "SuperSmoother.hpp"
#include "Logger.hpp"
#include "frame/DataFrameIO.hpp"
#include "validation/IndicatorValidator.hpp"
#include "validation/SampleData.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>

using namespace ehlers;
using namespace ehlers::validation;

// Compare our Super Smoother against a reference export (date column + one column per variant).
// --quiet prints nothing unless the comparison fails.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <SPY_D.csv> <reference.csv>"
                  << " [--length N] [--everget] [--pi X] [--sqrt2 X] [--column NAME]"
                  << " [--tolerance X] [--quiet]\n";
        return 1;
    }

    SsfOptions options;
    std::string column;
    double tolerance = 0.01;
    bool quiet = false;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--length" && i + 1 < argc) {
            options.length = std::atoi(argv[++i]);
        } else if (arg == "--everget") {
            options.everget = true;
        } else if (arg == "--pi" && i + 1 < argc) {
            options.pi = std::atof(argv[++i]);
        } else if (arg == "--sqrt2" && i + 1 < argc) {
            options.sqrt2 = std::atof(argv[++i]);
        } else if (arg == "--column" && i + 1 < argc) {
            column = argv[++i];
        } else if (arg == "--tolerance" && i + 1 < argc) {
            tolerance = std::atof(argv[++i]);
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }
    Logger::SetVerbose(!quiet);

    auto sample = SampleDataFixture::Load(argv[1]);
    if (!sample.ok()) {
        std::cerr << "ERROR: " << sample.status().ToString() << "\n";
        return 1;
    }

    auto reference = frame::DataFrameIO::read_csv(argv[2]);
    if (!reference.ok()) {
        std::cerr << "ERROR: " << reference.status().ToString() << "\n";
        return 1;
    }

    auto computed = compute_ssf(sample->close(), options);
    if (!computed) {
        std::cerr << "ERROR: " << sample->source_path() << " has fewer bars than the filter length\n";
        return 1;
    }
    if (column.empty()) {
        column = computed->name;
    }

    auto expected_values = reference->get_numeric_column(column);
    auto expected_dates = reference->get_index();
    if (!expected_values.ok() || !expected_dates.ok()) {
        std::cerr << "ERROR: reference column '" << column << "' unavailable\n";
        return 1;
    }
    const TimeSeries expected = from_values(column, std::move(*expected_dates), *expected_values);

    const IndicatorValidator validator(tolerance);
    const auto stats = validator.compare(*computed, expected);

    if (!quiet) {
        std::cout << computed->name << " over " << sample->size() << " bars of "
                  << sample->source_path() << " against " << column << "\n\n";

        std::cout << "First 10 values:\n";
        for (std::size_t i = 0; i < std::min<std::size_t>(10, computed->size()); ++i) {
            std::cout << "  " << computed->index[i]
                      << ": Ref=" << std::fixed << std::setprecision(4) << std::setw(12)
                      << (i < expected.size() ? expected.values[i].value_or(NAN) : NAN)
                      << ", Ours=" << std::setw(12) << computed->values[i].value_or(NAN) << "\n";
        }
        std::cout << std::defaultfloat << "\n" << format_report({stats});
    }

    if (!stats.passed) {
        std::cerr << computed->name << ": " << stats.status() << "\n";
        error_analysis(computed->name, "corr", stats.status(), kAlert);
        return 1;
    }

    if (stats.correlation) {
        error_analysis(computed->name, "corr", std::to_string(*stats.correlation), kInfo);
    }
    return 0;
}
