#pragma once

#include "Series.hpp"
#include "frame/AnalyticsDataFrame.hpp"
#include "frame/DataFrameIO.hpp"
#include <arrow/result.h>
#include <cstdint>
#include <string>

namespace ehlers {
namespace validation {

constexpr const char* kDefaultSampleFile = "data/SPY_D.csv";

/**
 * @brief Daily price bars loaded for regression checks
 *
 * Each test suite or tool run loads its own fixture; nothing is cached between runs.
 * Expected layout: date,open,high,low,close,volume
 */
class SampleDataFixture {
public:
    static arrow::Result<SampleDataFixture> Load(
        const std::string& file_path = kDefaultSampleFile,
        const frame::CsvReadOptions& options = frame::CsvReadOptions::Defaults());

    SampleDataFixture(SampleDataFixture&&) = default;
    SampleDataFixture& operator=(SampleDataFixture&&) = default;

    /// First n bars
    arrow::Result<SampleDataFixture> first(int64_t n) const;

    /// Last n bars
    arrow::Result<SampleDataFixture> last(int64_t n) const;

    /// Bars [start, end)
    arrow::Result<SampleDataFixture> slice(int64_t start, int64_t end) const;

    const frame::AnalyticsDataFrame& frame() const { return frame_; }
    const SingleMarketSeries& market() const { return market_; }
    const std::string& source_path() const { return source_path_; }
    std::size_t size() const { return market_.size(); }

    /// Close prices labeled by date
    TimeSeries close() const;

private:
    SampleDataFixture(frame::AnalyticsDataFrame frame, SingleMarketSeries market,
                      std::string source_path);

    static arrow::Result<SampleDataFixture> FromFrame(frame::AnalyticsDataFrame frame,
                                                      std::string source_path);

    frame::AnalyticsDataFrame frame_;
    SingleMarketSeries market_;
    std::string source_path_;
};

} // namespace validation
} // namespace ehlers
