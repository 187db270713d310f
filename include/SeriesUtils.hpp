#pragma once

#include "Series.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ehlers {

enum class FillMethod {
    Forward,
    Backward
};

/**
 * @brief Check that a series is usable as indicator input
 * @param series Input series (index and values must be aligned)
 * @param min_length Minimum number of samples required
 * @return Samples as doubles (absent samples become quiet NaN), or nullopt if unusable
 */
std::optional<std::vector<double>> verify_series(const TimeSeries& series, int min_length);

/// Absent offsets normalise to zero.
int get_offset(std::optional<int> offset) noexcept;

/**
 * @brief Shift values by a number of positions, keeping the index
 *
 * Positive periods move samples towards later labels and leave the head absent;
 * negative periods move them towards earlier labels and leave the tail absent.
 */
TimeSeries shift(const TimeSeries& series, int periods);

/// Replace every absent sample with a constant.
TimeSeries fill_value(const TimeSeries& series, double value);

/// Propagate present samples over gaps in the given direction.
TimeSeries fill_missing(const TimeSeries& series, FillMethod method);

std::optional<FillMethod> parse_fill_method(const std::string& method);
std::string to_string(FillMethod method);

/// Wrap raw samples as a series; NaN samples become absent.
TimeSeries from_values(std::string name, std::vector<std::string> index, std::span<const double> raw);

} // namespace ehlers
