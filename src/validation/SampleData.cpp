#include "validation/SampleData.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace ehlers {
namespace validation {

SampleDataFixture::SampleDataFixture(frame::AnalyticsDataFrame frame, SingleMarketSeries market,
                                     std::string source_path)
    : frame_(std::move(frame))
    , market_(std::move(market))
    , source_path_(std::move(source_path))
{
}

arrow::Result<SampleDataFixture> SampleDataFixture::Load(
    const std::string& file_path,
    const frame::CsvReadOptions& options)
{
    ARROW_ASSIGN_OR_RAISE(auto df, frame::DataFrameIO::read_csv(file_path, options));
    if (!df.has_index()) {
        return arrow::Status::Invalid("Index column '", options.index_column,
                                      "' not found in ", file_path);
    }

    ARROW_ASSIGN_OR_RAISE(auto fixture, FromFrame(std::move(df), file_path));
    if (Logger::IsVerbose()) {
        Logger::Log("Loaded " + std::to_string(fixture.size()) + " sample bars from " + file_path);
    }
    return fixture;
}

arrow::Result<SampleDataFixture> SampleDataFixture::FromFrame(frame::AnalyticsDataFrame frame,
                                                              std::string source_path)
{
    ARROW_ASSIGN_OR_RAISE(auto market, frame::DataFrameIO::to_market_series(frame));
    return SampleDataFixture(std::move(frame), std::move(market), std::move(source_path));
}

arrow::Result<SampleDataFixture> SampleDataFixture::first(int64_t n) const
{
    return slice(0, std::min<int64_t>(n, frame_.num_rows()));
}

arrow::Result<SampleDataFixture> SampleDataFixture::last(int64_t n) const
{
    const int64_t rows = frame_.num_rows();
    return slice(std::max<int64_t>(0, rows - n), rows);
}

arrow::Result<SampleDataFixture> SampleDataFixture::slice(int64_t start, int64_t end) const
{
    ARROW_ASSIGN_OR_RAISE(auto sliced, frame_.slice_by_row_index(start, end));
    return FromFrame(std::move(sliced), source_path_);
}

TimeSeries SampleDataFixture::close() const
{
    // "close" is always a known column
    auto series = column_series(market_, "close");
    return series ? std::move(*series) : TimeSeries{};
}

} // namespace validation
} // namespace ehlers
