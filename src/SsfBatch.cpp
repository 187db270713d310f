#include "SsfBatch.hpp"
#include "Logger.hpp"
#include "SeriesWriter.hpp"
#include "frame/DataFrameIO.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

namespace ehlers {

SsfBatch::SsfBatch(unsigned threads)
    : threads_(threads > 0 ? threads : std::max(1u, std::thread::hardware_concurrency()))
{
}

SsfColumn SsfBatch::compute(const SingleMarketSeries& market, const SsfDefinition& definition)
{
    SsfColumn column;
    column.variable_name = definition.variable_name;

    const auto start = std::chrono::steady_clock::now();
    if (auto source = column_series(market, definition.source_column)) {
        column.series = compute_ssf(*source, definition.options);
    }
    column.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    return column;
}

std::vector<SsfColumn> SsfBatch::run(const SingleMarketSeries& market,
                                     const std::vector<SsfDefinition>& definitions,
                                     const ProgressCallback& progress) const
{
    const std::size_t total = definitions.size();
    std::vector<SsfColumn> columns(total);

    std::mutex progress_mutex;
    std::size_t finished = 0;
    auto report = [&](std::size_t i) {
        if (progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            progress(++finished, total, definitions[i].variable_name);
        }
    };

    const std::size_t workers = std::min<std::size_t>(threads_, total);
    if (workers <= 1) {
        for (std::size_t i = 0; i < total; ++i) {
            columns[i] = compute(market, definitions[i]);
            report(i);
        }
        return columns;
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&, w]() {
            for (std::size_t i = w; i < total; i += workers) {
                columns[i] = compute(market, definitions[i]);
                report(i);
            }
        });
    }
    for (auto& worker : pool) {
        worker.join();
    }

    return columns;
}

arrow::Status compute_ssf_file(const std::string& price_file,
                               const std::string& config_file,
                               const std::string& output_file,
                               const SsfBatch& batch,
                               const ProgressCallback& progress)
{
    ARROW_ASSIGN_OR_RAISE(auto config, read_ssf_config(config_file));
    if (config.definitions.empty()) {
        return arrow::Status::Invalid("No Super Smoother definitions in ", config_file);
    }

    ARROW_ASSIGN_OR_RAISE(auto prices, frame::DataFrameIO::read_csv(price_file));
    ARROW_ASSIGN_OR_RAISE(auto market, frame::DataFrameIO::to_market_series(prices));
    if (market.size() == 0) {
        return arrow::Status::Invalid("No bars in ", price_file);
    }

    Logger::Log("Computing " + std::to_string(config.definitions.size()) + " definitions over "
                + std::to_string(market.size()) + " bars from " + price_file);

    auto columns = batch.run(market, config.definitions, progress);

    std::vector<TimeSeries> table;
    table.reserve(columns.size());
    for (auto& column : columns) {
        TimeSeries series;
        if (column.series) {
            series = std::move(*column.series);
        } else {
            Logger::Log("Warning: " + column.variable_name + " produced no values");
            series.index = market.date;
            series.values.assign(market.size(), std::nullopt);
        }
        series.name = column.variable_name;
        table.push_back(std::move(series));
    }

    ARROW_RETURN_NOT_OK(write_series_table(output_file, table, market.date));
    Logger::Log("Wrote " + std::to_string(table.size()) + " columns to " + output_file);
    return arrow::Status::OK();
}

} // namespace ehlers
