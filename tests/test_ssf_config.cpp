#include <gtest/gtest.h>

#include "Logger.hpp"
#include "SeriesWriter.hpp"
#include "SsfConfig.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ehlers;

#ifndef EHLERS_TEST_DATA_DIR
#define EHLERS_TEST_DATA_DIR "tests/data"
#endif

class SsfConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::SetCallback([this](const std::string& message) { log_.push_back(message); });
    }

    void TearDown() override
    {
        Logger::ClearCallback();
    }

    std::vector<std::string> log_;
};

TEST_F(SsfConfigTest, ParsesPositionalLength)
{
    auto def = parse_ssf_definition("SSF_S: SSF 10", 3);
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->variable_name, "SSF_S");
    EXPECT_EQ(def->options.length, 10);
    EXPECT_EQ(def->source_column, "close");
    EXPECT_EQ(def->line_number, 3);
    EXPECT_FALSE(def->options.everget.has_value());
}

TEST_F(SsfConfigTest, AcceptsBothOptionSyntaxes)
{
    auto def = parse_ssf_definition("SSF_E : SSF 20 --everget --PI=3.1415926 [OFFSET=-2]");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->variable_name, "SSF_E");
    EXPECT_EQ(def->options.everget, true);
    EXPECT_EQ(def->options.pi, 3.1415926);
    EXPECT_EQ(def->options.offset, -2);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SsfConfigTest, MapsEveryOption)
{
    auto def = parse_ssf_definition(
        "X: SSF 14 --everget=false --pi=3.2 --sqrt2=1.5 --offset=3 --fillna=0.5"
        " --fill_method=ffill --source=HIGH");
    ASSERT_TRUE(def.has_value());

    EXPECT_EQ(def->options.length, 14);
    EXPECT_EQ(def->options.everget, false);
    EXPECT_EQ(def->options.pi, 3.2);
    EXPECT_EQ(def->options.sqrt2, 1.5);
    EXPECT_EQ(def->options.offset, 3);
    EXPECT_EQ(def->options.fillna, 0.5);
    EXPECT_EQ(def->options.fill_method, FillMethod::Forward);
    EXPECT_EQ(def->source_column, "high");
}

TEST_F(SsfConfigTest, LengthOptionOverridesPositional)
{
    auto def = parse_ssf_definition("X: Super Smoother 10 --length=30");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->options.length, 30);
}

TEST_F(SsfConfigTest, UnparseableValuesLeaveDefaults)
{
    auto def = parse_ssf_definition("X: SSF 10.5 --pi=abc --everget=maybe --fill_method=nearest");
    ASSERT_TRUE(def.has_value());
    EXPECT_FALSE(def->options.length.has_value());
    EXPECT_FALSE(def->options.pi.has_value());
    EXPECT_FALSE(def->options.everget.has_value());
    EXPECT_FALSE(def->options.fill_method.has_value());

    const SsfParameters params(def->options);
    EXPECT_EQ(params.length, kDefaultSsfLength);
    EXPECT_EQ(params.pi, kDefaultSsfPi);
}

TEST_F(SsfConfigTest, UnknownOptionsAndStrayWordsAreLogged)
{
    auto def = parse_ssf_definition("X: SSF 10 --window=5 7");
    ASSERT_TRUE(def.has_value());
    EXPECT_EQ(def->options.length, 10);
    ASSERT_EQ(log_.size(), 2u);
    EXPECT_NE(log_[0].find("window"), std::string::npos);
    EXPECT_NE(log_[1].find("'7'"), std::string::npos);
}

TEST_F(SsfConfigTest, RejectsMalformedAndOtherIndicators)
{
    EXPECT_FALSE(parse_ssf_definition("SSF 20").has_value());
    EXPECT_FALSE(parse_ssf_definition(": SSF 20").has_value());
    EXPECT_FALSE(parse_ssf_definition("SSF_S:").has_value());
    EXPECT_FALSE(parse_ssf_definition("SSF_S: 20").has_value());

    std::string type;
    EXPECT_FALSE(parse_ssf_definition("B: RSI 10", 0, &type).has_value());
    EXPECT_EQ(type, "RSI");

    EXPECT_TRUE(is_ssf_type("ssf"));
    EXPECT_TRUE(is_ssf_type("SUPER SMOOTHER"));
    EXPECT_FALSE(is_ssf_type("SMA"));
}

TEST_F(SsfConfigTest, ReadsFileWithLineCounts)
{
    auto config = read_ssf_config(std::string(EHLERS_TEST_DATA_DIR) + "/ssf_vars.txt");
    ASSERT_TRUE(config.ok()) << config.status().ToString();

    EXPECT_EQ(config->total_lines, 12);
    EXPECT_EQ(config->comment_lines, 2);
    EXPECT_EQ(config->blank_lines, 1);
    EXPECT_EQ(config->invalid_lines, 1);
    EXPECT_EQ(config->unsupported_lines, 1);
    ASSERT_EQ(config->definitions.size(), 7u);
    EXPECT_EQ(config->definitions.front().variable_name, "SSF_20");
    EXPECT_EQ(config->definitions.back().variable_name, "SSF_BAD");
    EXPECT_EQ(config->definitions.back().options.length, -5);
    EXPECT_EQ(config->definitions.back().line_number, 10);

    // One line each for the malformed line and the RSI definition
    EXPECT_EQ(log_.size(), 2u);
}

TEST_F(SsfConfigTest, MissingFileIsAnIOError)
{
    auto config = read_ssf_config("/nonexistent/ssf_vars.txt");
    ASSERT_FALSE(config.ok());
    EXPECT_TRUE(config.status().IsIOError());
}

TEST_F(SsfConfigTest, FormatsDefinitionBackToSyntax)
{
    auto def = parse_ssf_definition("SSF_H: SSF 14 --source=high --fill_method=bfill --everget");
    ASSERT_TRUE(def.has_value());
    const auto line = format_definition(*def);
    EXPECT_EQ(line, "SSF_H: SSF 14 --everget --fill_method=bfill --source=high");

    auto reparsed = parse_ssf_definition(line);
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed->options.fill_method, FillMethod::Backward);
    EXPECT_EQ(reparsed->source_column, "high");

    auto precise = parse_ssf_definition("P: SSF --pi=3.141592653589793 --offset=-1 --fillna=0");
    ASSERT_TRUE(precise.has_value());
    EXPECT_EQ(format_definition(*precise), "P: SSF --pi=3.141592653589793 --offset=-1 --fillna=0");
}

TEST(SeriesWriterTest, CsvLeavesAbsentCellsEmpty)
{
    TimeSeries series;
    series.name = "SSF_2";
    series.index = {"2024-01-02", "2024-01-03", "2024-01-04"};
    series.values = {std::nullopt, 1.5, 2.25};

    const auto path = std::filesystem::temp_directory_path() / "ehlers_writer_test.csv";
    ASSERT_TRUE(write_series_table(path.string(), {series}, series.index).ok());

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(),
              "bar,date,SSF_2\n"
              "0,2024-01-02,\n"
              "1,2024-01-03,1.5\n"
              "2,2024-01-04,2.25\n");
    std::filesystem::remove(path);
}

TEST(SeriesWriterTest, TssbLayoutWritesNaN)
{
    TimeSeries series;
    series.name = "SSF_2";
    series.values = {std::nullopt, 1.5};

    const auto path = std::filesystem::temp_directory_path() / "ehlers_writer_test.txt";
    ASSERT_TRUE(write_series_table(path.string(), {series}, {"20240102", "20240103", "20240104"},
                                   TableFormat::Tssb()).ok());

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(), "date SSF_2\n20240102 NaN\n20240103 1.5\n20240104 NaN\n");
    std::filesystem::remove(path);
}

TEST(SeriesWriterTest, UnwritablePathIsAnIOError)
{
    auto status = write_series_table("/nonexistent/dir/out.csv", {}, {});
    EXPECT_TRUE(status.IsIOError());
}
