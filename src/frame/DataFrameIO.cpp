#include "frame/DataFrameIO.hpp"
#include <arrow/buffer.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/type.h>
#include <algorithm>
#include <sstream>
#include <vector>

namespace ehlers {
namespace frame {

arrow::Result<AnalyticsDataFrame> DataFrameIO::read_csv(
    const std::string& file_path,
    const CsvReadOptions& options) {

    ARROW_ASSIGN_OR_RAISE(auto input_file, arrow::io::ReadableFile::Open(file_path));

    char delimiter = options.delimiter;

    if (options.auto_detect_delimiter) {
        ARROW_ASSIGN_OR_RAISE(auto buffer, input_file->Read(1024));
        std::string sample(reinterpret_cast<const char*>(buffer->data()), buffer->size());

        std::istringstream stream(sample);
        std::string first_line;
        std::getline(stream, first_line);

        delimiter = detect_delimiter(first_line);

        ARROW_RETURN_NOT_OK(input_file->Seek(0));
    }

    ARROW_ASSIGN_OR_RAISE(auto table, parse_csv_stream(input_file, delimiter,
                                                       options.has_header,
                                                       options.index_column));

    return AnalyticsDataFrame(std::move(table), options.index_column);
}

arrow::Result<SingleMarketSeries> DataFrameIO::to_market_series(const AnalyticsDataFrame& df) {
    SingleMarketSeries series;

    ARROW_ASSIGN_OR_RAISE(series.open, df.get_numeric_column("open"));
    ARROW_ASSIGN_OR_RAISE(series.high, df.get_numeric_column("high"));
    ARROW_ASSIGN_OR_RAISE(series.low, df.get_numeric_column("low"));
    ARROW_ASSIGN_OR_RAISE(series.close, df.get_numeric_column("close"));
    ARROW_ASSIGN_OR_RAISE(series.volume, df.get_numeric_column("volume"));
    ARROW_ASSIGN_OR_RAISE(series.date, df.get_index());

    return series;
}

char DataFrameIO::detect_delimiter(const std::string& sample_line) {
    const std::vector<char> delimiters = {',', '\t', ';', '|'};
    std::vector<long> counts(delimiters.size(), 0);

    for (std::size_t i = 0; i < delimiters.size(); ++i) {
        counts[i] = std::count(sample_line.begin(), sample_line.end(), delimiters[i]);
    }

    auto max_it = std::max_element(counts.begin(), counts.end());
    if (max_it == counts.end() || *max_it == 0) {
        return ','; // Default
    }

    return delimiters[std::distance(counts.begin(), max_it)];
}

arrow::Result<std::shared_ptr<arrow::Table>> DataFrameIO::parse_csv_stream(
    std::shared_ptr<arrow::io::InputStream> input,
    char delimiter,
    bool has_header,
    const std::string& index_column) {

    arrow::csv::ReadOptions read_options = arrow::csv::ReadOptions::Defaults();
    read_options.use_threads = true;
    read_options.autogenerate_column_names = !has_header;

    arrow::csv::ParseOptions parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.delimiter = delimiter;

    arrow::csv::ConvertOptions convert_options = arrow::csv::ConvertOptions::Defaults();
    // Dates stay as labels; Arrow would otherwise infer date32 or timestamp
    if (!index_column.empty()) {
        convert_options.column_types[index_column] = arrow::utf8();
    }

    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(
        arrow::io::default_io_context(),
        input,
        read_options,
        parse_options,
        convert_options));

    return reader->Read();
}

} // namespace frame
} // namespace ehlers
