#include "validation/IndicatorValidator.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <unordered_map>

namespace ehlers {
namespace validation {

namespace {

bool usable(const std::optional<double>& value)
{
    return value && std::isfinite(*value);
}

std::string describe_limit(const char* what, double value, const char* relation, double limit)
{
    std::ostringstream text;
    text << what << ' ' << value << ' ' << relation << ' ' << limit;
    return text.str();
}

} // anonymous namespace

std::string ComparisonStats::status() const
{
    if (passed) {
        return "PASS";
    }
    std::string joined;
    for (const auto& failure : failures) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += failure;
    }
    return joined;
}

IndicatorValidator::IndicatorValidator(double max_abs_error, double min_correlation)
    : max_abs_error_(max_abs_error)
    , min_correlation_(min_correlation)
{
}

ComparisonStats IndicatorValidator::compare(const TimeSeries& computed, const TimeSeries& expected) const
{
    ComparisonStats stats;
    stats.indicator_name = computed.name;
    stats.computed_bars = computed.size();

    if (!computed.is_aligned() || !expected.is_aligned()) {
        stats.failures.push_back("index and values differ in length");
        return stats;
    }

    std::unordered_map<std::string_view, std::size_t> reference_row;
    reference_row.reserve(expected.size());
    for (std::size_t row = 0; row < expected.size(); ++row) {
        reference_row.emplace(expected.index[row], row);
    }

    std::vector<double> ours;
    std::vector<double> theirs;
    double sum_error = 0.0;
    double sum_squared = 0.0;

    for (std::size_t i = 0; i < computed.size(); ++i) {
        const auto match = reference_row.find(computed.index[i]);
        if (match == reference_row.end()) {
            continue;
        }
        ++stats.matched_bars;

        const auto& value = computed.values[i];
        const auto& reference = expected.values[match->second];
        if (!usable(value)) {
            ++stats.missing_computed;
        }
        if (!usable(reference)) {
            ++stats.missing_expected;
        }
        if (!usable(value) || !usable(reference)) {
            continue;
        }

        const double error = *value - *reference;
        sum_error += error;
        sum_squared += error * error;
        stats.max_abs_error = std::max(stats.max_abs_error, std::fabs(error));
        ours.push_back(*value);
        theirs.push_back(*reference);
    }

    stats.compared_bars = ours.size();
    if (stats.compared_bars == 0) {
        stats.failures.push_back("no comparable bars");
        return stats;
    }

    const auto n = static_cast<double>(stats.compared_bars);
    stats.bias = sum_error / n;
    stats.rms_error = std::sqrt(sum_squared / n);
    stats.correlation = pearson_correlation(ours, theirs);

    if (stats.max_abs_error > max_abs_error_) {
        stats.failures.push_back(describe_limit("max error", stats.max_abs_error, ">", max_abs_error_));
    }
    if (stats.correlation && *stats.correlation < min_correlation_) {
        stats.failures.push_back(describe_limit("correlation", *stats.correlation, "<", min_correlation_));
    }

    stats.passed = stats.failures.empty();
    return stats;
}

std::optional<double> pearson_correlation(std::span<const double> x, std::span<const double> y)
{
    if (x.size() != y.size() || x.size() < 2) {
        return std::nullopt;
    }

    // Running means and co-moments (Welford)
    double mean_x = 0.0;
    double mean_y = 0.0;
    double spread_x = 0.0;
    double spread_y = 0.0;
    double co_moment = 0.0;

    for (std::size_t k = 0; k < x.size(); ++k) {
        const double weight = 1.0 / static_cast<double>(k + 1);
        const double dx = x[k] - mean_x;
        const double dy = y[k] - mean_y;
        mean_x += dx * weight;
        mean_y += dy * weight;
        spread_x += dx * (x[k] - mean_x);
        spread_y += dy * (y[k] - mean_y);
        co_moment += dx * (y[k] - mean_y);
    }

    if (spread_x <= 0.0 || spread_y <= 0.0) {
        return std::nullopt;
    }
    return co_moment / std::sqrt(spread_x * spread_y);
}

std::string format_report(const std::vector<ComparisonStats>& stats)
{
    std::ostringstream out;

    for (const auto& s : stats) {
        out << std::left << std::setw(12) << s.indicator_name << std::right
            << (s.passed ? " PASS" : " FAIL")
            << "  bars " << s.compared_bars << '/' << s.computed_bars
            << std::scientific << std::setprecision(3)
            << "  max|err| " << s.max_abs_error
            << "  rms " << s.rms_error
            << "  bias " << s.bias
            << "  corr ";
        if (s.correlation) {
            out << std::fixed << std::setprecision(6) << *s.correlation;
        } else {
            out << "n/a";
        }
        out << std::defaultfloat;
        if (!s.passed) {
            out << "  (" << s.status() << ")";
        }
        out << '\n';
    }

    const auto passed = std::count_if(stats.begin(), stats.end(),
                                      [](const ComparisonStats& s) { return s.passed; });
    out << passed << " of " << stats.size() << " series within tolerance\n";
    return out.str();
}

std::string error_analysis(
    const std::string& name,
    const std::string& kind,
    const std::string& message,
    const std::string& icon,
    bool newline)
{
    std::string line = icon + " " + name + "['" + kind + "']: " + message;
    if (newline) {
        line = "\n" + line;
    }

    if (Logger::IsVerbose()) {
        Logger::Log(line);
    }
    return line;
}

} // namespace validation
} // namespace ehlers
