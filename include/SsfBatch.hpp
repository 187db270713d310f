#pragma once

#include "Series.hpp"
#include "SsfConfig.hpp"

#include <arrow/status.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ehlers {

/// One computed column of a batch run.
struct SsfColumn {
    std::string variable_name;
    std::optional<TimeSeries> series;  // nullopt: unknown source column or too few bars
    double elapsed_ms = 0.0;
};

/// Called once per finished definition; calls are serialised.
/// Args: finished count, total count, variable name
using ProgressCallback = std::function<void(std::size_t, std::size_t, const std::string&)>;

/**
 * @brief Computes many Super Smoother definitions over one market
 *
 * Definitions are independent, so workers split them by stride and write
 * disjoint result slots. Results come back in definition order.
 */
class SsfBatch {
public:
    /// @param threads Worker count; 0 uses every hardware thread, 1 runs on the caller's thread
    explicit SsfBatch(unsigned threads = 0);

    unsigned thread_count() const { return threads_; }

    std::vector<SsfColumn> run(const SingleMarketSeries& market,
                               const std::vector<SsfDefinition>& definitions,
                               const ProgressCallback& progress = nullptr) const;

    static SsfColumn compute(const SingleMarketSeries& market, const SsfDefinition& definition);

private:
    unsigned threads_;
};

/**
 * @brief Price CSV + definitions file -> indicator CSV
 *
 * Output columns are bar, date and one column per definition, named by its variable.
 * Definitions that produce nothing are written as empty columns.
 */
arrow::Status compute_ssf_file(const std::string& price_file,
                               const std::string& config_file,
                               const std::string& output_file,
                               const SsfBatch& batch = SsfBatch(),
                               const ProgressCallback& progress = nullptr);

} // namespace ehlers
