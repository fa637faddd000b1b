/**
 * @file config_loader.cpp
 * @brief Engine configuration loading, validation and serialization
 */

#include "biz/dedup/config/config_loader.h"
#include "biz/dedup/record/business_record.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

namespace biz::dedup::config {

namespace {

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] config_load_error make_error(
    config_error code, std::string message,
    std::optional<size_t> line = std::nullopt) {
    return config_load_error{.code = code,
                             .message = std::move(message),
                             .file_path = std::nullopt,
                             .line_number = line,
                             .validation_errors = {}};
}

/**
 * @brief Read entire file contents
 */
[[nodiscard]] std::expected<std::string, config_load_error> read_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        auto error = make_error(
            config_error::file_not_found,
            std::format("Configuration file not found: {}", path.string()));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    std::ifstream file(path);
    if (!file) {
        auto error = make_error(
            config_error::io_error,
            std::format("Failed to open file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        auto error = make_error(
            config_error::io_error,
            std::format("Error reading file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    return buffer.str();
}

/**
 * @brief Write string to file
 */
[[nodiscard]] std::expected<void, config_load_error> write_file(
    const std::filesystem::path& path, std::string_view content) {
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            auto error = make_error(
                config_error::io_error,
                std::format("Failed to create directory: {}", parent.string()));
            error.file_path = path;
            return std::unexpected(std::move(error));
        }
    }

    std::ofstream file(path);
    if (!file) {
        auto error = make_error(
            config_error::io_error,
            std::format("Failed to create file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    file << content;

    if (!file) {
        auto error = make_error(
            config_error::io_error,
            std::format("Failed to write file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    return {};
}

/**
 * @brief Trim whitespace from string
 */
[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

/**
 * @brief Remove quotes from string value
 */
[[nodiscard]] std::string unquote(std::string_view str) {
    if (str.length() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return std::string(str.substr(1, str.length() - 2));
        }
    }
    return std::string(str);
}

/**
 * @brief Drop a trailing " # comment" outside of quotes
 */
[[nodiscard]] std::string strip_comment(std::string_view line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' ||
                                line[i - 1] == '\t')) {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

[[nodiscard]] std::string to_lower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

/**
 * @brief Parse boolean value
 */
[[nodiscard]] std::optional<bool> parse_bool(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief Parse integer value
 */
[[nodiscard]] std::optional<int64_t> parse_int(std::string_view str) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse non-negative size value
 */
[[nodiscard]] std::optional<size_t> parse_size(std::string_view str) {
    auto value = parse_int(str);
    if (!value || *value < 0) return std::nullopt;
    return static_cast<size_t>(*value);
}

/**
 * @brief Parse floating point value
 */
[[nodiscard]] std::optional<double> parse_double(std::string_view str) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse duration value ("200ms", "2s", "1m" or plain milliseconds)
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(
    std::string_view str) {
    if (str.empty()) return std::nullopt;

    if (auto value = parse_int(str)) {
        return std::chrono::milliseconds(*value);
    }

    auto unit_pos = str.find_first_not_of("0123456789");
    auto number = parse_int(str.substr(0, unit_pos));
    if (!number) return std::nullopt;

    auto unit = to_lower(str.substr(unit_pos));
    if (unit == "ms") return std::chrono::milliseconds(*number);
    if (unit == "s") return std::chrono::milliseconds(*number * 1000);
    if (unit == "m") return std::chrono::milliseconds(*number * 60000);
    return std::nullopt;
}

/**
 * @brief Split a comma separated list, trimming and unquoting items
 */
[[nodiscard]] std::vector<std::string> parse_list(std::string_view str) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= str.size()) {
        auto end = str.find(',', start);
        if (end == std::string_view::npos) end = str.size();
        auto item = unquote(trim(str.substr(start, end - start)));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

[[nodiscard]] std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += ", ";
        result += item;
    }
    return result;
}

// =============================================================================
// Simple YAML Parser (subset)
// =============================================================================

/**
 * @brief Parses indented "key: value" YAML into dotted keys
 *
 * Supports nested sections, "- item" lists (joined with commas into the
 * parent key) and comments. Anchors, flow mappings and multi-line
 * scalars are not supported.
 */
class simple_yaml_parser {
public:
    struct entry {
        std::string value;
        size_t line = 0;
    };

    struct parse_result {
        std::map<std::string, entry> values;
        size_t error_line = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        std::vector<std::pair<std::string, int>> sections;
        size_t line_number = 0;

        std::istringstream stream{std::string{content}};
        std::string raw_line;

        while (std::getline(stream, raw_line)) {
            ++line_number;

            auto line = strip_comment(raw_line);
            auto trimmed = trim(line);
            if (trimmed.empty()) {
                continue;
            }

            int indent = 0;
            for (char c : line) {
                if (c == ' ')
                    indent++;
                else if (c == '\t')
                    indent += 2;
                else
                    break;
            }

            // List item: appended to the innermost enclosing section
            if (trimmed.starts_with("- ") || trimmed == "-") {
                while (!sections.empty() && indent < sections.back().second) {
                    sections.pop_back();
                }
                if (sections.empty()) {
                    return fail(result, line_number,
                                "List item without enclosing key");
                }
                auto item = unquote(trim(std::string_view(trimmed).substr(1)));
                auto& target = result.values[build_path(sections)];
                if (!target.value.empty()) target.value += ", ";
                target.value += item;
                target.line = line_number;
                continue;
            }

            while (!sections.empty() && indent <= sections.back().second) {
                sections.pop_back();
            }

            auto colon_pos = find_separator(trimmed);
            if (colon_pos == std::string::npos) {
                return fail(result, line_number,
                            "Invalid YAML syntax: missing colon");
            }

            auto key = unquote(trim(std::string_view(trimmed).substr(0, colon_pos)));
            auto value = trim(std::string_view(trimmed).substr(colon_pos + 1));
            if (key.empty()) {
                return fail(result, line_number, "Invalid YAML syntax: empty key");
            }

            if (value.empty()) {
                sections.emplace_back(key, indent);
            } else {
                auto path = build_path(sections);
                if (!path.empty()) path += ".";
                path += key;
                result.values[path] = {unquote(value), line_number};
            }
        }

        return result;
    }

private:
    static parse_result& fail(parse_result& result, size_t line,
                              std::string message) {
        result.success = false;
        result.error_line = line;
        result.error_message = std::move(message);
        return result;
    }

    // A ':' followed by whitespace or the end of the line, outside quotes
    [[nodiscard]] static size_t find_separator(std::string_view line) {
        char quote = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote != 0) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == ':' &&
                       (i + 1 == line.size() || line[i + 1] == ' ' ||
                        line[i + 1] == '\t')) {
                return i;
            }
        }
        return std::string::npos;
    }

    [[nodiscard]] static std::string build_path(
        const std::vector<std::pair<std::string, int>>& stack) {
        std::string path;
        for (const auto& [part, indent] : stack) {
            if (!path.empty()) path += ".";
            path += part;
        }
        return path;
    }
};

// =============================================================================
// Value Application
// =============================================================================

/**
 * @brief Applies parsed key/value pairs to an engine_config
 */
class config_builder {
public:
    explicit config_builder(engine_config& config) : config_(config) {}

    [[nodiscard]] std::expected<void, config_load_error> apply(
        const std::string& key, const std::string& val, size_t line) {
        line_ = line;
        key_ = key;

        // Engine
        if (key == "name") {
            config_.name = val;
        } else if (key == "logging.level") {
            integration::log_level level;
            if (!integration::parse_log_level(val, level)) return invalid(val);
            config_.log_level = level;
        }
        // Scoring
        else if (key.starts_with("scoring.weights.")) {
            auto field = record::parse_field(key.substr(16));
            auto weight = parse_double(val);
            if (!field || !weight) return invalid(val);
            config_.scoring.weights[*field] = *weight;
        } else if (key == "scoring.high_confidence") {
            return set_double(config_.scoring.high_confidence, val);
        } else if (key == "scoring.medium_confidence") {
            return set_double(config_.scoring.medium_confidence, val);
        } else if (key == "scoring.model_weight") {
            return set_double(config_.scoring.model_weight, val);
        } else if (key == "scoring.auto_merge_threshold") {
            return set_double(config_.scoring.auto_merge_threshold, val);
        }
        // Blocking index
        else if (key == "index.shard_count") {
            return set_size(config_.blocking.shard_count, val);
        } else if (key == "index.max_block_size") {
            return set_size(config_.blocking.max_block_size, val);
        } else if (key == "index.phone_key_digits") {
            return set_size(config_.blocking.phone_key_digits, val);
        } else if (key == "index.name_prefix_length") {
            return set_size(config_.blocking.name_prefix_length, val);
        }
        // Normalization tables
        else if (key == "normalization.legal_suffixes") {
            config_.normalization.legal_suffixes = lowered_list(val);
        } else if (key == "normalization.connector_words") {
            config_.normalization.connector_words = lowered_list(val);
        } else if (key == "normalization.shared_email_domains") {
            config_.normalization.shared_email_domains = lowered_list(val);
        } else if (key.starts_with("normalization.abbreviations.")) {
            config_.normalization.street_abbreviations[to_lower(key.substr(28))] =
                to_lower(val);
        } else if (key.starts_with("normalization.region_aliases.")) {
            config_.normalization.region_aliases[to_lower(key.substr(29))] =
                to_lower(val);
        }
        // Worker pools
        else if (key == "pool.threads") {
            return set_size(config_.pool.min_threads, val);
        } else if (key == "pool.max_threads") {
            return set_size(config_.pool.max_threads, val);
        } else if (key == "pool.queue_capacity") {
            return set_size(config_.pool.queue_capacity, val);
        } else if (key == "pool.work_stealing") {
            return set_bool(config_.pool.enable_work_stealing, val);
        } else if (key == "scorer.threads") {
            return set_size(config_.scorer_threads, val);
        } else if (key == "scorer.timeout") {
            auto timeout = parse_duration(val);
            if (!timeout) return invalid(val);
            config_.scorer_timeout = *timeout;
        }
        // Default options
        else if (key == "defaults.threshold") {
            return set_double(config_.default_options.threshold, val);
        } else if (key == "defaults.algorithms") {
            config_.default_options.algorithms.clear();
            for (const auto& name : parse_list(val)) {
                auto algorithm = record::parse_algorithm(name);
                if (!algorithm) return invalid(name);
                config_.default_options.algorithms.push_back(*algorithm);
            }
        } else if (key == "defaults.check_fields") {
            config_.default_options.check_fields.clear();
            for (const auto& name : parse_list(val)) {
                auto field = record::parse_field(name);
                if (!field) return invalid(name);
                config_.default_options.check_fields.push_back(*field);
            }
        } else if (key.starts_with("defaults.field_thresholds.")) {
            auto field = record::parse_field(key.substr(26));
            auto threshold = parse_double(val);
            if (!field || !threshold) return invalid(val);
            config_.default_options.field_thresholds[*field] = *threshold;
        } else if (key == "defaults.deep_check") {
            return set_bool(config_.default_options.deep_check, val);
        } else if (key == "defaults.auto_merge") {
            return set_bool(config_.default_options.auto_merge, val);
        } else if (key == "defaults.merge_strategy") {
            auto strategy = record::parse_merge_strategy(val);
            if (!strategy) return invalid(val);
            config_.default_options.merge_strategy = *strategy;
        } else if (key == "defaults.batch_size") {
            auto size = parse_int(val);
            if (!size || *size < std::numeric_limits<int>::min() ||
                *size > std::numeric_limits<int>::max()) {
                return invalid(val);
            }
            config_.default_options.batch_size = static_cast<int>(*size);
        } else {
            integration::get_logger().warning(
                std::format("config: ignoring unknown key '{}' (line {})", key,
                            line));
        }

        return {};
    }

private:
    [[nodiscard]] std::unexpected<config_load_error> invalid(
        std::string_view value) const {
        return std::unexpected(make_error(
            config_error::invalid_value,
            std::format("Invalid value '{}' for key '{}'", value, key_), line_));
    }

    [[nodiscard]] std::expected<void, config_load_error> set_double(
        double& target, const std::string& val) const {
        auto value = parse_double(val);
        if (!value) return invalid(val);
        target = *value;
        return {};
    }

    [[nodiscard]] std::expected<void, config_load_error> set_size(
        size_t& target, const std::string& val) const {
        auto value = parse_size(val);
        if (!value) return invalid(val);
        target = *value;
        return {};
    }

    [[nodiscard]] std::expected<void, config_load_error> set_bool(
        bool& target, const std::string& val) const {
        auto value = parse_bool(val);
        if (!value) return invalid(val);
        target = *value;
        return {};
    }

    [[nodiscard]] static std::vector<std::string> lowered_list(
        const std::string& val) {
        auto items = parse_list(val);
        for (auto& item : items) {
            item = to_lower(item);
        }
        return items;
    }

    engine_config& config_;
    std::string key_;
    size_t line_ = 0;
};

}  // namespace

// =============================================================================
// config_load_error Implementation
// =============================================================================

std::string config_load_error::to_string() const {
    std::string result = message;

    if (file_path) {
        result += " (file: " + file_path->string() + ")";
    }
    if (line_number) {
        result += " at line " + std::to_string(*line_number);
    }

    if (!validation_errors.empty()) {
        result += "\nValidation errors:";
        for (const auto& err : validation_errors) {
            result += "\n  - " + err.field_path + ": " + err.message;
            if (err.actual_value) {
                result += " (got: " + *err.actual_value + ")";
            }
            if (err.expected) {
                result += " (expected: " + *err.expected + ")";
            }
        }
    }

    return result;
}

// =============================================================================
// config_loader Implementation
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    auto ext = to_lower(path.extension().string());
    if (ext != ".yaml" && ext != ".yml") {
        auto error = make_error(
            config_error::invalid_format,
            std::format("Unknown configuration file format: {}. Use .yaml or "
                        ".yml",
                        ext));
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto result = load_yaml_string(*content, path.string());
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(std::move(error));
    }

    return result;
}

config_result config_loader::load_yaml_string(std::string_view yaml_content,
                                              std::string_view source_name) {
    if (trim(yaml_content).empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration content is empty"));
    }

    auto parsed = simple_yaml_parser::parse(yaml_content);
    if (!parsed.success) {
        return std::unexpected(make_error(config_error::parse_error,
                                          parsed.error_message,
                                          parsed.error_line));
    }

    engine_config config;
    config_builder builder(config);

    for (const auto& [key, entry] : parsed.values) {
        auto expanded = expand_env_vars(entry.value);
        if (!expanded) {
            auto error = expanded.error();
            error.line_number = entry.line;
            return std::unexpected(std::move(error));
        }

        if (auto applied = builder.apply(key, *expanded, entry.line); !applied) {
            return std::unexpected(applied.error());
        }
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        integration::get_logger().warning(std::format(
            "config: {} failed validation with {} error(s)", source_name,
            errors.size()));
        return std::unexpected(config_load_error{
            .code = config_error::validation_error,
            .message = "Configuration validation failed",
            .file_path = std::nullopt,
            .line_number = std::nullopt,
            .validation_errors = std::move(errors)});
    }

    return config;
}

std::vector<validation_error_info> config_loader::validate(
    const engine_config& config) {
    return config.validate();
}

std::expected<void, config_load_error> config_loader::save_yaml(
    const engine_config& config, const std::filesystem::path& path) {
    return write_file(path, to_yaml(config));
}

std::string config_loader::to_yaml(const engine_config& config) {
    std::ostringstream ss;

    ss << "# Business deduplication engine configuration\n";
    ss << "# Generated by config_loader\n\n";

    ss << "name: \"" << config.name << "\"\n\n";

    ss << "logging:\n";
    ss << "  level: " << integration::to_string(config.log_level) << "\n\n";

    // Scoring
    ss << "scoring:\n";
    ss << "  weights:\n";
    for (const auto& [field, weight] : config.scoring.weights) {
        ss << "    " << record::to_string(field) << ": "
           << std::format("{}", weight) << "\n";
    }
    ss << "  high_confidence: " << std::format("{}", config.scoring.high_confidence)
       << "\n";
    ss << "  medium_confidence: "
       << std::format("{}", config.scoring.medium_confidence) << "\n";
    ss << "  model_weight: " << std::format("{}", config.scoring.model_weight)
       << "\n";
    ss << "  auto_merge_threshold: "
       << std::format("{}", config.scoring.auto_merge_threshold) << "\n\n";

    // Index
    ss << "index:\n";
    ss << "  shard_count: " << config.blocking.shard_count << "\n";
    ss << "  max_block_size: " << config.blocking.max_block_size << "\n";
    ss << "  phone_key_digits: " << config.blocking.phone_key_digits << "\n";
    ss << "  name_prefix_length: " << config.blocking.name_prefix_length
       << "\n\n";

    // Normalization
    const auto& rules = config.normalization;
    ss << "normalization:\n";
    ss << "  legal_suffixes: " << join(rules.legal_suffixes) << "\n";
    ss << "  connector_words: " << join(rules.connector_words) << "\n";
    ss << "  shared_email_domains: " << join(rules.shared_email_domains) << "\n";
    if (!rules.street_abbreviations.empty()) {
        ss << "  abbreviations:\n";
        for (const auto& [from, to] : rules.street_abbreviations) {
            ss << "    " << from << ": " << to << "\n";
        }
    }
    if (!rules.region_aliases.empty()) {
        ss << "  region_aliases:\n";
        for (const auto& [from, to] : rules.region_aliases) {
            ss << "    \"" << from << "\": \"" << to << "\"\n";
        }
    }
    ss << "\n";

    // Pools
    ss << "pool:\n";
    ss << "  threads: " << config.pool.min_threads << "\n";
    ss << "  max_threads: " << config.pool.max_threads << "\n";
    ss << "  queue_capacity: " << config.pool.queue_capacity << "\n";
    ss << "  work_stealing: "
       << (config.pool.enable_work_stealing ? "true" : "false") << "\n\n";

    ss << "scorer:\n";
    ss << "  threads: " << config.scorer_threads << "\n";
    ss << "  timeout: " << config.scorer_timeout.count() << "ms\n\n";

    // Default options
    const auto& options = config.default_options;
    ss << "defaults:\n";
    ss << "  threshold: " << std::format("{}", options.threshold) << "\n";
    if (!options.algorithms.empty()) {
        std::vector<std::string> names;
        for (auto algorithm : options.algorithms) {
            names.emplace_back(record::to_string(algorithm));
        }
        ss << "  algorithms: " << join(names) << "\n";
    }
    if (!options.check_fields.empty()) {
        std::vector<std::string> names;
        for (auto field : options.check_fields) {
            names.emplace_back(record::to_string(field));
        }
        ss << "  check_fields: " << join(names) << "\n";
    }
    if (!options.field_thresholds.empty()) {
        ss << "  field_thresholds:\n";
        for (const auto& [field, threshold] : options.field_thresholds) {
            ss << "    " << record::to_string(field) << ": "
               << std::format("{}", threshold) << "\n";
        }
    }
    ss << "  deep_check: " << (options.deep_check ? "true" : "false") << "\n";
    ss << "  auto_merge: " << (options.auto_merge ? "true" : "false") << "\n";
    ss << "  merge_strategy: " << record::to_string(options.merge_strategy)
       << "\n";
    ss << "  batch_size: " << options.batch_size << "\n";

    return ss.str();
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        if (value[pos] == '$' && pos + 1 < value.size() &&
            value[pos + 1] == '{') {
            size_t end = value.find('}', pos + 2);
            if (end == std::string_view::npos) {
                return std::unexpected(
                    make_error(config_error::parse_error,
                               "Unclosed environment variable reference"));
            }

            std::string_view ref = value.substr(pos + 2, end - pos - 2);
            std::string var_name;
            std::string default_value;
            bool has_default = false;

            if (auto colon_pos = ref.find(":-");
                colon_pos != std::string_view::npos) {
                var_name = std::string(ref.substr(0, colon_pos));
                default_value = std::string(ref.substr(colon_pos + 2));
                has_default = true;
            } else {
                var_name = std::string(ref);
            }

            const char* env_val = std::getenv(var_name.c_str());
            if (env_val != nullptr) {
                result += env_val;
            } else if (has_default) {
                result += default_value;
            } else {
                return std::unexpected(make_error(
                    config_error::env_var_not_found,
                    std::format("Environment variable '{}' not found",
                                var_name)));
            }

            pos = end + 1;
        } else {
            result += value[pos++];
        }
    }

    return result;
}

bool config_loader::needs_env_expansion(std::string_view value) {
    return value.find("${") != std::string_view::npos;
}

engine_config config_loader::get_default_config() { return engine_config{}; }

}  // namespace biz::dedup::config
