#pragma once

#include "Series.hpp"

#include <arrow/status.h>
#include <string>
#include <vector>

namespace ehlers {

/// Column layout of a written indicator table.
struct TableFormat {
    char separator = ',';
    std::string missing;        // written for absent samples
    bool bar_column = true;     // leading 0-based bar number

    static TableFormat Csv() { return TableFormat{}; }
    static TableFormat Tssb() { return TableFormat{' ', "NaN", false}; }
};

/**
 * @brief Write series side by side, one row per bar
 *
 * Column headers are the series names. Dates, when given, follow the bar column.
 * Rows run to the longest of the dates and the series; short columns are padded
 * with the missing token.
 */
arrow::Status write_series_table(const std::string& output_path,
                                 const std::vector<TimeSeries>& columns,
                                 const std::vector<std::string>& dates,
                                 const TableFormat& format = TableFormat::Csv());

} // namespace ehlers
