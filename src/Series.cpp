#include "Series.hpp"

#include <algorithm>
#include <cctype>

namespace ehlers {

std::size_t TimeSeries::valid_count() const noexcept
{
    return static_cast<std::size_t>(std::count_if(values.begin(), values.end(),
        [](const std::optional<double>& v) { return v.has_value(); }));
}

std::optional<TimeSeries> column_series(const SingleMarketSeries& market, std::string_view column)
{
    std::string key(column);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    const std::vector<double>* source = nullptr;
    if (key == "open") {
        source = &market.open;
    } else if (key == "high") {
        source = &market.high;
    } else if (key == "low") {
        source = &market.low;
    } else if (key == "close") {
        source = &market.close;
    } else if (key == "volume") {
        source = &market.volume;
    } else {
        return std::nullopt;
    }

    TimeSeries series;
    series.name = key;
    series.index = market.date;
    series.values.assign(source->begin(), source->end());

    // Markets built without dates still get an ordinal index
    if (series.index.empty() && !series.values.empty()) {
        series.index.reserve(series.values.size());
        for (std::size_t i = 0; i < series.values.size(); ++i) {
            series.index.push_back(std::to_string(i));
        }
    }

    return series;
}

} // namespace ehlers
