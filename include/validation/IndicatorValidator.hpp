#pragma once

#include "Series.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ehlers {
namespace validation {

constexpr const char* kAlert = "[!]";
constexpr const char* kInfo = "[i]";

/// Minimum acceptable correlation between computed and reference values
constexpr double kCorrelationThreshold = 0.99;

/**
 * @brief Agreement between a computed series and a reference series
 *
 * Bars are matched by index label, not by position.
 */
struct ComparisonStats {
    std::string indicator_name;
    std::size_t computed_bars = 0;
    std::size_t matched_bars = 0;      // computed labels found in the reference
    std::size_t compared_bars = 0;     // matched and finite on both sides
    std::size_t missing_computed = 0;  // matched, computed absent or non-finite
    std::size_t missing_expected = 0;  // matched, reference absent or non-finite

    double bias = 0.0;                 // mean of computed - expected
    double max_abs_error = 0.0;
    double rms_error = 0.0;
    std::optional<double> correlation; // undefined below two bars or for a flat series

    bool passed = false;
    std::vector<std::string> failures;

    /// "PASS" or the failures joined by "; "
    std::string status() const;
};

class IndicatorValidator {
public:
    explicit IndicatorValidator(double max_abs_error = 0.01,
                                double min_correlation = kCorrelationThreshold);

    /**
     * @brief Compare two labeled series
     *
     * Each computed bar is looked up in the reference by its label; the first
     * reference row carrying a label wins. Correlation is only checked when it
     * is defined.
     */
    ComparisonStats compare(const TimeSeries& computed, const TimeSeries& expected) const;

private:
    double max_abs_error_;
    double min_correlation_;
};

/// Pearson correlation; nullopt when either side has no spread.
std::optional<double> pearson_correlation(std::span<const double> x, std::span<const double> y);

/// One line per comparison followed by a pass count.
std::string format_report(const std::vector<ComparisonStats>& stats);

/**
 * @brief Format a diagnostic line "{icon} {name}['{kind}']: {message}"
 *
 * The line is logged when verbose output is enabled and returned either way.
 */
std::string error_analysis(
    const std::string& name,
    const std::string& kind,
    const std::string& message,
    const std::string& icon = kInfo,
    bool newline = true
);

} // namespace validation
} // namespace ehlers
