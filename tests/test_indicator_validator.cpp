#include <gtest/gtest.h>

#include "Logger.hpp"
#include "validation/IndicatorValidator.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace ehlers;
using namespace ehlers::validation;

namespace {

TimeSeries labeled(const std::vector<std::string>& labels, const std::vector<std::optional<double>>& values)
{
    TimeSeries series;
    series.name = "SSF_20";
    series.index = labels;
    series.values = values;
    return series;
}

} // namespace

TEST(IndicatorValidatorTest, IdenticalSeriesPass)
{
    auto series = labeled({"a", "b", "c", "d", "e"}, {1.0, 2.0, 3.0, 4.0, 5.0});
    auto stats = IndicatorValidator().compare(series, series);

    EXPECT_TRUE(stats.passed);
    EXPECT_EQ(stats.status(), "PASS");
    EXPECT_EQ(stats.compared_bars, 5u);
    EXPECT_DOUBLE_EQ(stats.max_abs_error, 0.0);
    ASSERT_TRUE(stats.correlation.has_value());
    EXPECT_NEAR(*stats.correlation, 1.0, 1e-12);
}

TEST(IndicatorValidatorTest, MatchesBarsByLabelNotPosition)
{
    auto computed = labeled({"2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07"},
                            {10.0, 11.0, 12.5, 12.0});
    // Reference rows in a different order, with one extra date and one date missing
    auto expected = labeled({"2020-01-07", "2019-12-31", "2020-01-02", "2020-01-06"},
                            {12.0, 99.0, 10.0, 12.5});

    auto stats = IndicatorValidator(1e-12).compare(computed, expected);
    EXPECT_EQ(stats.computed_bars, 4u);
    EXPECT_EQ(stats.matched_bars, 3u);
    EXPECT_EQ(stats.compared_bars, 3u);
    EXPECT_DOUBLE_EQ(stats.max_abs_error, 0.0);
    EXPECT_TRUE(stats.passed) << stats.status();
}

TEST(IndicatorValidatorTest, FirstDuplicateReferenceLabelWins)
{
    auto computed = labeled({"x", "y"}, {1.0, 2.0});
    auto expected = labeled({"x", "y", "y"}, {1.0, 2.0, 50.0});
    auto stats = IndicatorValidator(1e-12).compare(computed, expected);
    EXPECT_TRUE(stats.passed) << stats.status();
}

TEST(IndicatorValidatorTest, AbsentValuesAreCountedNotCompared)
{
    auto computed = labeled({"a", "b", "c", "d", "e"},
                            {std::nullopt, 2.0, 3.0, 4.0, std::numeric_limits<double>::quiet_NaN()});
    auto expected = labeled({"a", "b", "c", "d", "e"}, {1.0, 2.0, std::nullopt, 4.0, 5.0});

    auto stats = IndicatorValidator().compare(computed, expected);
    EXPECT_EQ(stats.matched_bars, 5u);
    EXPECT_EQ(stats.compared_bars, 2u);
    EXPECT_EQ(stats.missing_computed, 2u);
    EXPECT_EQ(stats.missing_expected, 1u);
}

TEST(IndicatorValidatorTest, LowCorrelationFails)
{
    auto computed = labeled({"a", "b", "c", "d"}, {1.0, 2.0, 3.0, 4.0});
    auto expected = labeled({"a", "b", "c", "d"}, {4.0, 3.0, 2.0, 1.0});

    auto stats = IndicatorValidator(10.0).compare(computed, expected);
    EXPECT_FALSE(stats.passed);
    ASSERT_TRUE(stats.correlation.has_value());
    EXPECT_NEAR(*stats.correlation, -1.0, 1e-12);
    ASSERT_EQ(stats.failures.size(), 1u);
    EXPECT_NE(stats.status().find("correlation"), std::string::npos);
}

TEST(IndicatorValidatorTest, ErrorStatistics)
{
    auto computed = labeled({"a", "b", "c", "d"}, {1.0, 2.0, 3.0, 5.0});
    auto expected = labeled({"a", "b", "c", "d"}, {1.0, 2.0, 3.0, 4.0});

    auto stats = IndicatorValidator(0.5).compare(computed, expected);
    EXPECT_DOUBLE_EQ(stats.bias, 0.25);
    EXPECT_DOUBLE_EQ(stats.max_abs_error, 1.0);
    EXPECT_DOUBLE_EQ(stats.rms_error, 0.5);
    EXPECT_FALSE(stats.passed);
    EXPECT_NE(stats.status().find("max error"), std::string::npos);
}

TEST(IndicatorValidatorTest, FlatSeriesSkipsCorrelation)
{
    auto flat = labeled({"a", "b", "c"}, {7.0, 7.0, 7.0});
    auto stats = IndicatorValidator().compare(flat, flat);
    EXPECT_FALSE(stats.correlation.has_value());
    EXPECT_TRUE(stats.passed);
}

TEST(IndicatorValidatorTest, NoSharedLabelsFails)
{
    auto stats = IndicatorValidator().compare(labeled({"a"}, {1.0}), labeled({"b"}, {1.0}));
    EXPECT_EQ(stats.matched_bars, 0u);
    EXPECT_FALSE(stats.passed);
    EXPECT_EQ(stats.status(), "no comparable bars");
}

TEST(IndicatorValidatorTest, MisalignedSeriesFails)
{
    auto broken = labeled({"a"}, {1.0, 2.0});
    auto stats = IndicatorValidator().compare(broken, labeled({"a"}, {1.0}));
    EXPECT_FALSE(stats.passed);
    EXPECT_EQ(stats.compared_bars, 0u);
}

TEST(IndicatorValidatorTest, PearsonCorrelation)
{
    const std::vector<double> x = {1.0, 2.0, 3.0, 4.0};
    const std::vector<double> y = {2.0, 4.1, 5.9, 8.0};
    auto r = pearson_correlation(x, y);
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(*r, 0.99);
    EXPECT_LE(*r, 1.0);

    EXPECT_FALSE(pearson_correlation(x, std::vector<double>{1.0, 2.0}).has_value());
    EXPECT_FALSE(pearson_correlation(std::vector<double>{1.0}, std::vector<double>{1.0}).has_value());
}

TEST(IndicatorValidatorTest, ReportListsEachSeries)
{
    auto good = IndicatorValidator().compare(labeled({"a", "b"}, {1.0, 2.0}), labeled({"a", "b"}, {1.0, 2.0}));
    auto bad = IndicatorValidator().compare(labeled({"a"}, {1.0}), labeled({"z"}, {1.0}));
    bad.indicator_name = "SSFe_20";

    auto report = format_report({good, bad});
    EXPECT_NE(report.find("SSF_20"), std::string::npos);
    EXPECT_NE(report.find("SSFe_20"), std::string::npos);
    EXPECT_NE(report.find("no comparable bars"), std::string::npos);
    EXPECT_NE(report.find("1 of 2 series within tolerance"), std::string::npos);
}

TEST(ErrorAnalysisTest, FormatsAndLogsWhenVerbose)
{
    std::vector<std::string> lines;
    Logger::SetCallback([&](const std::string& message) { lines.push_back(message); });

    Logger::SetVerbose(true);
    auto line = error_analysis("SSF_20", "corr", "0.97", kAlert);
    EXPECT_EQ(line, "\n[!] SSF_20['corr']: 0.97");
    ASSERT_EQ(lines.size(), 1u);

    Logger::SetVerbose(false);
    EXPECT_EQ(error_analysis("SSF_20", "corr", "ok", kInfo, false), "[i] SSF_20['corr']: ok");
    EXPECT_EQ(lines.size(), 1u);

    Logger::SetVerbose(true);
    Logger::ClearCallback();
}
