#include "SeriesUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ehlers {

std::optional<std::vector<double>> verify_series(const TimeSeries& series, int min_length)
{
    if (!series.is_aligned() || series.values.empty()) {
        return std::nullopt;
    }
    if (min_length > 0 && series.size() < static_cast<std::size_t>(min_length)) {
        return std::nullopt;
    }

    std::vector<double> samples;
    samples.reserve(series.size());
    for (const auto& value : series.values) {
        samples.push_back(value.value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    return samples;
}

int get_offset(std::optional<int> offset) noexcept
{
    return offset.value_or(0);
}

TimeSeries shift(const TimeSeries& series, int periods)
{
    TimeSeries shifted;
    shifted.name = series.name;
    shifted.category = series.category;
    shifted.index = series.index;
    shifted.values.assign(series.size(), std::nullopt);

    const auto n = static_cast<long long>(series.size());
    const auto p = static_cast<long long>(periods);
    if (std::llabs(p) >= n) {
        return shifted;
    }

    for (long long i = 0; i < n; ++i) {
        const long long src = i - p;
        if (src >= 0 && src < n) {
            shifted.values[static_cast<std::size_t>(i)] = series.values[static_cast<std::size_t>(src)];
        }
    }
    return shifted;
}

TimeSeries fill_value(const TimeSeries& series, double value)
{
    TimeSeries filled = series;
    for (auto& sample : filled.values) {
        if (!sample.has_value()) {
            sample = value;
        }
    }
    return filled;
}

TimeSeries fill_missing(const TimeSeries& series, FillMethod method)
{
    TimeSeries filled = series;
    std::optional<double> carry;

    if (method == FillMethod::Forward) {
        for (auto& sample : filled.values) {
            if (sample.has_value()) {
                carry = sample;
            } else {
                sample = carry;
            }
        }
    } else {
        for (auto it = filled.values.rbegin(); it != filled.values.rend(); ++it) {
            if (it->has_value()) {
                carry = *it;
            } else {
                *it = carry;
            }
        }
    }
    return filled;
}

std::optional<FillMethod> parse_fill_method(const std::string& method)
{
    std::string key = method;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (key == "ffill" || key == "pad" || key == "forward") {
        return FillMethod::Forward;
    }
    if (key == "bfill" || key == "backfill" || key == "backward") {
        return FillMethod::Backward;
    }
    return std::nullopt;
}

std::string to_string(FillMethod method)
{
    switch (method) {
        case FillMethod::Forward: return "ffill";
        case FillMethod::Backward: return "bfill";
    }
    return "unknown";
}

TimeSeries from_values(std::string name, std::vector<std::string> index, std::span<const double> raw)
{
    TimeSeries series;
    series.name = std::move(name);
    series.index = std::move(index);
    series.values.reserve(raw.size());
    for (double v : raw) {
        if (std::isnan(v)) {
            series.values.emplace_back(std::nullopt);
        } else {
            series.values.emplace_back(v);
        }
    }
    return series;
}

} // namespace ehlers
