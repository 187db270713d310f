#include "SuperSmoother.hpp"

#include <cmath>

namespace ehlers {

std::vector<double> ssf_recurrence(std::span<const double> x, int n, double pi, double sqrt2)
{
    std::vector<double> result(x.begin(), x.end());
    const std::size_t m = x.size();

    const double ratio = sqrt2 / n;
    const double a = std::exp(-pi * ratio);
    const double b = 2.0 * a * std::cos(180.0 * ratio);
    const double c = a * a - b + 1.0;

    for (std::size_t i = 2; i < m; ++i) {
        result[i] = 0.5 * c * (x[i] + x[i - 1]) + b * result[i - 1]
            - a * a * result[i - 2];
    }

    return result;
}

std::vector<double> ssf_everget_recurrence(std::span<const double> x, int n, double pi, double sqrt2)
{
    std::vector<double> result(x.begin(), x.end());
    const std::size_t m = x.size();

    const double arg = pi * sqrt2 / n;
    const double a = std::exp(-arg);
    const double b = 2.0 * a * std::cos(arg);

    for (std::size_t i = 2; i < m; ++i) {
        result[i] = 0.5 * (a * a - b + 1.0) * (x[i] + x[i - 1])
            + b * result[i - 1] - a * a * result[i - 2];
    }

    return result;
}

SsfParameters::SsfParameters(const SsfOptions& options) noexcept
    : fillna(options.fillna)
    , fill_method(options.fill_method)
{
    if (options.length && *options.length > 0) {
        length = *options.length;
    }
    everget = options.everget.value_or(false);
    // NaN fails the comparison and falls back as well
    if (options.pi && *options.pi > 0.0) {
        pi = *options.pi;
    }
    if (options.sqrt2 && *options.sqrt2 > 0.0) {
        sqrt2 = *options.sqrt2;
    }
    offset = get_offset(options.offset);
}

std::string ssf_name(int length, bool everget)
{
    return std::string(everget ? "SSFe_" : "SSF_") + std::to_string(length);
}

std::optional<TimeSeries> compute_ssf(const TimeSeries& close, const SsfOptions& options)
{
    const SsfParameters params(options);

    auto samples = verify_series(close, params.length);
    if (!samples) {
        return std::nullopt;
    }

    const auto raw = params.everget
        ? ssf_everget_recurrence(*samples, params.length, params.pi, params.sqrt2)
        : ssf_recurrence(*samples, params.length, params.pi, params.sqrt2);

    TimeSeries result = from_values(ssf_name(params.length, params.everget), close.index, raw);
    result.category = kSsfCategory;

    if (params.offset != 0) {
        result = shift(result, params.offset);
    }

    if (params.fillna) {
        result = fill_value(result, *params.fillna);
    }
    if (params.fill_method) {
        result = fill_missing(result, *params.fill_method);
    }

    return result;
}

} // namespace ehlers
