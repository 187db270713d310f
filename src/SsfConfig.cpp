#include "SsfConfig.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <system_error>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace ehlers {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(kBlank);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kBlank);
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::string_view> split_words(std::string_view text)
{
    std::vector<std::string_view> words;
    std::size_t pos = 0;
    while ((pos = text.find_first_not_of(kBlank, pos)) != std::string_view::npos) {
        const auto end = std::min(text.find_first_of(kBlank, pos), text.size());
        words.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return words;
}

std::optional<double> to_double(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string buffer(text);
    char* end = nullptr;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) {
        return std::nullopt;
    }
    return value;
}

// Whole numbers only: "10.5" and "1e9" leave the option unset
std::optional<int> to_int(std::string_view text)
{
    const auto value = to_double(text);
    if (!value || std::floor(*value) != *value
        || *value < static_cast<double>(INT_MIN) || *value > static_cast<double>(INT_MAX)) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<bool> to_bool(std::string_view text)
{
    const auto word = lowercase(text);
    if (word == "true" || word == "1" || word == "yes" || word == "on") {
        return true;
    }
    if (word == "false" || word == "0" || word == "no" || word == "off") {
        return false;
    }
    return std::nullopt;
}

bool is_option_token(std::string_view token)
{
    return token.starts_with("--")
        || (token.size() >= 3 && token.front() == '[' && token.back() == ']');
}

std::string format_number(double value)
{
    std::array<char, 32> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return ec == std::errc() ? std::string(buffer.data(), end) : std::string("nan");
}

} // anonymous namespace

bool is_ssf_type(std::string_view type)
{
    const auto word = lowercase(type);
    return word == "ssf" || word == "super smoother";
}

bool apply_ssf_option(std::string_view key, std::string_view value, SsfDefinition& definition)
{
    auto& options = definition.options;
    const auto name = lowercase(key);

    if (name == "length") {
        options.length = to_int(value);
    } else if (name == "everget") {
        options.everget = to_bool(value);
    } else if (name == "pi") {
        options.pi = to_double(value);
    } else if (name == "sqrt2") {
        options.sqrt2 = to_double(value);
    } else if (name == "offset") {
        options.offset = to_int(value);
    } else if (name == "fillna") {
        options.fillna = to_double(value);
    } else if (name == "fill_method") {
        options.fill_method = parse_fill_method(std::string(value));
    } else if (name == "source") {
        definition.source_column = value.empty() ? std::string("close") : lowercase(value);
    } else {
        return false;
    }
    return true;
}

std::optional<SsfDefinition> parse_ssf_definition(std::string_view line,
                                                  int line_number,
                                                  std::string* type_out)
{
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }

    const auto name = trim(line.substr(0, colon));
    const auto words = split_words(line.substr(colon + 1));
    if (name.empty()) {
        return std::nullopt;
    }

    // The type is every word before the first number or option
    std::string type;
    std::size_t next = 0;
    for (; next < words.size(); ++next) {
        if (is_option_token(words[next]) || to_double(words[next])) {
            break;
        }
        if (!type.empty()) {
            type += ' ';
        }
        type += words[next];
    }
    if (type.empty()) {
        return std::nullopt;
    }
    if (type_out) {
        *type_out = type;
    }
    if (!is_ssf_type(type)) {
        return std::nullopt;
    }

    SsfDefinition definition;
    definition.variable_name = std::string(name);
    definition.line_number = line_number;

    bool positional_length = false;
    for (; next < words.size(); ++next) {
        std::string_view word = words[next];

        if (!is_option_token(word)) {
            if (!positional_length && to_double(word)) {
                definition.options.length = to_int(word);
                positional_length = true;
            } else {
                Logger::Log("Ignoring '" + std::string(word) + "' in definition of "
                            + definition.variable_name);
            }
            continue;
        }

        if (word.front() == '[') {
            word = word.substr(1, word.size() - 2);
        } else {
            word.remove_prefix(2);
        }
        const auto eq = word.find('=');
        const auto key = word.substr(0, eq);
        const auto value = eq == std::string_view::npos ? std::string_view("true") : word.substr(eq + 1);

        if (!apply_ssf_option(key, value, definition)) {
            Logger::Log("Ignoring unknown option '" + std::string(key) + "' in definition of "
                        + definition.variable_name);
        }
    }

    return definition;
}

SsfConfig parse_ssf_config(std::istream& input, const std::string& origin)
{
    SsfConfig config;
    std::string raw;

    while (std::getline(input, raw)) {
        const int line_number = ++config.total_lines;
        const auto line = trim(raw);

        if (line.empty()) {
            ++config.blank_lines;
            continue;
        }
        if (line.front() == ';' || line.front() == '#') {
            ++config.comment_lines;
            continue;
        }

        std::string type;
        if (auto definition = parse_ssf_definition(line, line_number, &type)) {
            config.definitions.push_back(std::move(*definition));
        } else if (!type.empty()) {
            ++config.unsupported_lines;
            Logger::Log("Warning: skipping " + type + " definition on line "
                        + std::to_string(line_number) + " of " + origin);
        } else {
            ++config.invalid_lines;
            Logger::Log("Skipping malformed line " + std::to_string(line_number)
                        + " of " + origin + ": " + std::string(line));
        }
    }

    return config;
}

arrow::Result<SsfConfig> read_ssf_config(const std::string& file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return arrow::Status::IOError("Cannot open definitions file: ", file_path);
    }
    return parse_ssf_config(file, file_path);
}

std::string format_definition(const SsfDefinition& definition)
{
    const auto& options = definition.options;
    std::string line = definition.variable_name + ": SSF";

    if (options.length) {
        line += " " + std::to_string(*options.length);
    }
    if (options.everget) {
        line += *options.everget ? " --everget" : " --everget=false";
    }
    if (options.pi) {
        line += " --pi=" + format_number(*options.pi);
    }
    if (options.sqrt2) {
        line += " --sqrt2=" + format_number(*options.sqrt2);
    }
    if (options.offset) {
        line += " --offset=" + std::to_string(*options.offset);
    }
    if (options.fillna) {
        line += " --fillna=" + format_number(*options.fillna);
    }
    if (options.fill_method) {
        line += " --fill_method=" + to_string(*options.fill_method);
    }
    if (definition.source_column != "close") {
        line += " --source=" + definition.source_column;
    }
    return line;
}

} // namespace ehlers
