#pragma once

#include "frame/AnalyticsDataFrame.hpp"
#include "Series.hpp"
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <string>

namespace ehlers {
namespace frame {

struct CsvReadOptions {
    bool auto_detect_delimiter = true;
    char delimiter = ',';
    bool has_header = true;
    std::string index_column = "date";

    static CsvReadOptions Defaults() {
        return CsvReadOptions{};
    }
};

class DataFrameIO {
public:
    /// Read a delimited price file. The index column is always read as text.
    static arrow::Result<AnalyticsDataFrame> read_csv(
        const std::string& file_path,
        const CsvReadOptions& options = CsvReadOptions::Defaults());

    /// Requires open, high, low, close and volume columns.
    static arrow::Result<SingleMarketSeries> to_market_series(const AnalyticsDataFrame& df);

    static char detect_delimiter(const std::string& sample_line);

private:
    static arrow::Result<std::shared_ptr<arrow::Table>> parse_csv_stream(
        std::shared_ptr<arrow::io::InputStream> input,
        char delimiter,
        bool has_header,
        const std::string& index_column);
};

} // namespace frame
} // namespace ehlers
