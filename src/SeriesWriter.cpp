#include "SeriesWriter.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>

namespace ehlers {

arrow::Status write_series_table(const std::string& output_path,
                                 const std::vector<TimeSeries>& columns,
                                 const std::vector<std::string>& dates,
                                 const TableFormat& format)
{
    std::ofstream out(output_path);
    if (!out.is_open()) {
        return arrow::Status::IOError("Cannot open output file: ", output_path);
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    std::size_t rows = dates.size();
    for (const auto& column : columns) {
        rows = std::max(rows, column.size());
    }

    // Separator goes before every field except the first of a row
    bool first_field = true;
    auto field = [&]() -> std::ofstream& {
        if (!first_field) {
            out << format.separator;
        }
        first_field = false;
        return out;
    };

    if (format.bar_column) {
        field() << "bar";
    }
    if (!dates.empty()) {
        field() << "date";
    }
    for (const auto& column : columns) {
        field() << column.name;
    }
    out << '\n';

    for (std::size_t row = 0; row < rows; ++row) {
        first_field = true;
        if (format.bar_column) {
            field() << row;
        }
        if (!dates.empty()) {
            field() << (row < dates.size() ? dates[row] : format.missing);
        }
        for (const auto& column : columns) {
            auto& cell = field();
            if (row < column.size() && column.values[row]) {
                cell << *column.values[row];
            } else {
                cell << format.missing;
            }
        }
        out << '\n';
    }

    out.flush();
    if (!out) {
        return arrow::Status::IOError("Failed writing ", output_path);
    }
    return arrow::Status::OK();
}

} // namespace ehlers
