#pragma once

#include "Series.hpp"
#include "SeriesUtils.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ehlers {

// Ehlers' truncated constants; callers may pass more precise values.
constexpr int kDefaultSsfLength = 20;
constexpr double kDefaultSsfPi = 3.14159;
constexpr double kDefaultSsfSqrt2 = 1.414;
constexpr const char* kSsfCategory = "overlap";

/**
 * @brief Two-pole Super Smoother, Ehlers' formulation
 *
 * ratio = sqrt2 / n, a = exp(-pi * ratio), b = 2a cos(180 * ratio), c = a^2 - b + 1
 * y[i] = c/2 (x[i] + x[i-1]) + b y[i-1] - a^2 y[i-2]
 *
 * The cosine argument uses the literal 180. The first two outputs are the inputs.
 */
std::vector<double> ssf_recurrence(std::span<const double> x, int n, double pi, double sqrt2);

/**
 * @brief Two-pole Super Smoother, Everget's TradingView formulation
 *
 * arg = pi * sqrt2 / n, a = exp(-arg), b = 2a cos(arg)
 * y[i] = (a^2 - b + 1)/2 (x[i] + x[i-1]) + b y[i-1] - a^2 y[i-2]
 */
std::vector<double> ssf_everget_recurrence(std::span<const double> x, int n, double pi, double sqrt2);

/// Caller-facing parameters; anything absent or invalid falls back to a default.
struct SsfOptions {
    std::optional<int> length;
    std::optional<bool> everget;
    std::optional<double> pi;
    std::optional<double> sqrt2;
    std::optional<int> offset;
    std::optional<double> fillna;
    std::optional<FillMethod> fill_method;
};

/// Resolved parameters. Defaults are substituted on construction.
struct SsfParameters {
    int length = kDefaultSsfLength;
    bool everget = false;
    double pi = kDefaultSsfPi;
    double sqrt2 = kDefaultSsfSqrt2;
    int offset = 0;
    std::optional<double> fillna;
    std::optional<FillMethod> fill_method;

    SsfParameters() = default;
    explicit SsfParameters(const SsfOptions& options) noexcept;
};

/// "SSF_20" or "SSFe_20".
std::string ssf_name(int length, bool everget);

/**
 * @brief Super Smoother Filter over a labeled series
 *
 * Returns nullopt when the input is shorter than the resolved length or misaligned.
 * The output keeps the input index; offset and fills are applied after filtering.
 */
std::optional<TimeSeries> compute_ssf(const TimeSeries& close, const SsfOptions& options = {});

} // namespace ehlers
