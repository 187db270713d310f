#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ehlers {

struct SingleMarketSeries {
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;
    std::vector<std::string> date;

    std::size_t size() const noexcept { return close.size(); }
};

/// Labeled series: one optional sample per index label.
struct TimeSeries {
    std::string name;
    std::string category;
    std::vector<std::string> index;
    std::vector<std::optional<double>> values;

    std::size_t size() const noexcept { return values.size(); }
    bool is_aligned() const noexcept { return index.size() == values.size(); }
    std::size_t valid_count() const noexcept;
};

/// Build a series from one price column ("open", "high", "low", "close", "volume").
std::optional<TimeSeries> column_series(const SingleMarketSeries& market, std::string_view column);

} // namespace ehlers
