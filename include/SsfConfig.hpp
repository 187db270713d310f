#pragma once

#include "SuperSmoother.hpp"

#include <arrow/result.h>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ehlers {

/**
 * @brief One Super Smoother column requested by a definitions file
 *
 * Line syntax:
 *   NAME: SSF [length] [--key=value | --key | [KEY=value]] ...
 *
 * Keys: length, everget, pi, sqrt2, offset, fillna, fill_method, source.
 * A bare --key means "true". Values that do not parse leave the option unset.
 */
struct SsfDefinition {
    std::string variable_name;
    std::string source_column = "close";
    SsfOptions options;
    int line_number = 0;
};

/// Definitions read from a file together with per-line bookkeeping.
struct SsfConfig {
    std::vector<SsfDefinition> definitions;

    int total_lines = 0;
    int comment_lines = 0;    // ';' or '#'
    int blank_lines = 0;
    int invalid_lines = 0;    // no "NAME:" prefix or no indicator type
    int unsupported_lines = 0; // well-formed, but not a Super Smoother
};

/// Indicator type words accepted for a definition ("SSF", "Super Smoother").
bool is_ssf_type(std::string_view type);

/**
 * @brief Parse a single definition line
 *
 * Returns nullopt for malformed lines and for indicator types other than SSF;
 * @p type_out receives the indicator type whenever the line is well formed.
 */
std::optional<SsfDefinition> parse_ssf_definition(std::string_view line,
                                                  int line_number = 0,
                                                  std::string* type_out = nullptr);

/// Apply one key/value option. Returns false when the key is not an SSF option.
bool apply_ssf_option(std::string_view key, std::string_view value, SsfDefinition& definition);

/// Parse a definitions stream; skipped lines are logged with @p origin.
SsfConfig parse_ssf_config(std::istream& input, const std::string& origin = "<stream>");

arrow::Result<SsfConfig> read_ssf_config(const std::string& file_path);

/// Inverse of parse_ssf_definition for the options that are set.
std::string format_definition(const SsfDefinition& definition);

} // namespace ehlers
