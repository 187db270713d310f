#include "frame/AnalyticsDataFrame.hpp"

#include <arrow/array.h>
#include <arrow/scalar.h>
#include <arrow/type.h>
#include <limits>

namespace ehlers {
namespace frame {

namespace {

template<typename ArrayType>
void append_numeric_chunk(const arrow::Array& chunk, std::vector<double>& out)
{
    const auto& typed = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < typed.length(); ++i) {
        if (typed.IsNull(i)) {
            out.push_back(std::numeric_limits<double>::quiet_NaN());
        } else {
            out.push_back(static_cast<double>(typed.Value(i)));
        }
    }
}

} // anonymous namespace

AnalyticsDataFrame::AnalyticsDataFrame() = default;

AnalyticsDataFrame::AnalyticsDataFrame(std::shared_ptr<arrow::Table> cpu_table,
                                       std::string index_column)
    : cpu_table_(std::move(cpu_table)) {
    if (cpu_table_) {
        schema_ = cpu_table_->schema();
        if (!index_column.empty() && schema_->GetFieldIndex(index_column) != -1) {
            index_column_ = std::move(index_column);
        }
    }
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::slice_by_row_index(
    int64_t start, int64_t end) const {

    if (!cpu_table_) {
        return arrow::Status::Invalid("No data available");
    }

    if (start < 0 || end > cpu_table_->num_rows() || start >= end) {
        return arrow::Status::Invalid("Invalid row indices");
    }

    auto sliced_table = cpu_table_->Slice(start, end - start);
    return create_from_cpu_table(sliced_table);
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::select_columns(
    const std::vector<std::string>& column_names) const {

    if (!cpu_table_) {
        return arrow::Status::Invalid("No data available");
    }

    std::vector<int> column_indices;
    if (has_index()) {
        column_indices.push_back(schema_->GetFieldIndex(index_column_));
    }

    for (const auto& name : column_names) {
        if (name == index_column_) {
            continue;
        }
        auto index = schema_->GetFieldIndex(name);
        if (index == -1) {
            return arrow::Status::Invalid("Column not found: ", name);
        }
        column_indices.push_back(index);
    }

    ARROW_ASSIGN_OR_RAISE(auto selected_table, cpu_table_->SelectColumns(column_indices));
    return create_from_cpu_table(selected_table);
}

arrow::Result<std::vector<double>> AnalyticsDataFrame::get_numeric_column(
    const std::string& column_name) const {

    if (!cpu_table_) {
        return arrow::Status::Invalid("No data available");
    }

    auto column = cpu_table_->GetColumnByName(column_name);
    if (!column) {
        return arrow::Status::Invalid("Column not found: ", column_name);
    }

    std::vector<double> values;
    values.reserve(static_cast<std::size_t>(column->length()));

    for (const auto& chunk : column->chunks()) {
        switch (chunk->type_id()) {
            case arrow::Type::DOUBLE:
                append_numeric_chunk<arrow::DoubleArray>(*chunk, values);
                break;
            case arrow::Type::FLOAT:
                append_numeric_chunk<arrow::FloatArray>(*chunk, values);
                break;
            case arrow::Type::INT64:
                append_numeric_chunk<arrow::Int64Array>(*chunk, values);
                break;
            case arrow::Type::INT32:
                append_numeric_chunk<arrow::Int32Array>(*chunk, values);
                break;
            case arrow::Type::NA:
                // Column of empty cells
                values.insert(values.end(), static_cast<std::size_t>(chunk->length()),
                              std::numeric_limits<double>::quiet_NaN());
                break;
            default:
                return arrow::Status::TypeError("Column '", column_name, "' is not numeric: ",
                                                chunk->type()->ToString());
        }
    }

    return values;
}

arrow::Result<std::vector<std::string>> AnalyticsDataFrame::get_index() const {
    std::vector<std::string> labels;

    if (!cpu_table_) {
        return labels;
    }

    labels.reserve(static_cast<std::size_t>(cpu_table_->num_rows()));

    if (!has_index()) {
        for (int64_t i = 0; i < cpu_table_->num_rows(); ++i) {
            labels.push_back(std::to_string(i));
        }
        return labels;
    }

    auto column = cpu_table_->GetColumnByName(index_column_);
    for (const auto& chunk : column->chunks()) {
        if (chunk->type_id() == arrow::Type::STRING) {
            const auto& strings = static_cast<const arrow::StringArray&>(*chunk);
            for (int64_t i = 0; i < strings.length(); ++i) {
                labels.push_back(strings.IsNull(i) ? std::string() : strings.GetString(i));
            }
        } else {
            for (int64_t i = 0; i < chunk->length(); ++i) {
                ARROW_ASSIGN_OR_RAISE(auto scalar, chunk->GetScalar(i));
                labels.push_back(scalar->is_valid ? scalar->ToString() : std::string());
            }
        }
    }

    return labels;
}

int64_t AnalyticsDataFrame::num_rows() const {
    return cpu_table_ ? cpu_table_->num_rows() : 0;
}

int64_t AnalyticsDataFrame::num_columns() const {
    return cpu_table_ ? cpu_table_->num_columns() : 0;
}

std::vector<std::string> AnalyticsDataFrame::column_names() const {
    if (!schema_) {
        return {};
    }
    return schema_->field_names();
}

bool AnalyticsDataFrame::has_column(const std::string& column_name) const {
    return schema_ && schema_->GetFieldIndex(column_name) != -1;
}

arrow::Result<AnalyticsDataFrame> AnalyticsDataFrame::create_from_cpu_table(
    std::shared_ptr<arrow::Table> table) const {
    return AnalyticsDataFrame(std::move(table), index_column_);
}

} // namespace frame
} // namespace ehlers
