#pragma once

#include <arrow/result.h>
#include <arrow/table.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ehlers {
namespace frame {

// Column-oriented price table with an optional label column used as the row index.
class AnalyticsDataFrame {
public:
    AnalyticsDataFrame();
    explicit AnalyticsDataFrame(std::shared_ptr<arrow::Table> cpu_table,
                                std::string index_column = "");

    AnalyticsDataFrame(const AnalyticsDataFrame&) = delete;
    AnalyticsDataFrame& operator=(const AnalyticsDataFrame&) = delete;

    AnalyticsDataFrame(AnalyticsDataFrame&&) = default;
    AnalyticsDataFrame& operator=(AnalyticsDataFrame&&) = default;

    /// Rows [start, end).
    arrow::Result<AnalyticsDataFrame> slice_by_row_index(
        int64_t start, int64_t end) const;

    /// Keeps the index column even when it is not listed.
    arrow::Result<AnalyticsDataFrame> select_columns(
        const std::vector<std::string>& column_names) const;

    /// Numeric column as doubles; nulls become NaN.
    arrow::Result<std::vector<double>> get_numeric_column(const std::string& column_name) const;

    /// Row labels from the index column, or ordinals when no index is set.
    arrow::Result<std::vector<std::string>> get_index() const;

    int64_t num_rows() const;
    int64_t num_columns() const;
    std::vector<std::string> column_names() const;
    bool has_column(const std::string& column_name) const;

    bool has_index() const { return !index_column_.empty(); }
    const std::string& index_column() const { return index_column_; }


private:
    std::shared_ptr<arrow::Table> cpu_table_;
    std::shared_ptr<arrow::Schema> schema_;
    std::string index_column_;

    arrow::Result<AnalyticsDataFrame> create_from_cpu_table(
        std::shared_ptr<arrow::Table> table) const;
};

} // namespace frame
} // namespace ehlers
