/**
 * @file config.hpp
 * @brief Application configuration for wbc
 *
 * Defines the runtime configuration including:
 * - File locations (catalog template, flow enable flags)
 * - Balance status thresholds
 * - Diagnostics verbosity
 */

#pragma once

#include "types.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace wbc {

/**
 * @brief Balance check settings
 */
struct BalanceConfig {
    Real excellent_threshold = constants::EXCELLENT_THRESHOLD;  ///< [%]
    Real good_threshold = constants::GOOD_THRESHOLD;            ///< [%]
    bool verbose = false;   ///< Print warnings to stderr

    /// Classify an error percentage (nullopt means N/A)
    BalanceStatus classify(std::optional<Real> error_percent) const;

    bool validate() const;
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from key-value file
    static Config from_file(const std::filesystem::path& filepath);

    // Save to key-value file
    void to_file(const std::filesystem::path& filepath) const;

    // Validate configuration
    bool validate() const;

    BalanceConfig balance;

    // File paths (relative paths resolve against the config file directory)
    std::filesystem::path catalog_file;
    std::filesystem::path flow_config_file = "balance_check_config.yaml";
    std::filesystem::path measurements_file;

    // Print summary
    void print_summary(std::ostream& os) const;
};

// ============================================================================
// Key-value Parser Helpers
// ============================================================================

namespace config_io {

/**
 * @brief One significant line of a key-value file
 *
 * `value` is empty for section headers (`key:` with nothing after it).
 */
struct KeyValueLine {
    int indent = 0;
    std::string key;
    std::string value;
    int line_number = 0;
};

/// Strip comments and blank lines, split `key: value`. Lines without a
/// colon are returned with an empty key and the text in `value`.
std::vector<KeyValueLine> tokenize(std::istream& is);

std::string trim(const std::string& s);

/// Parse "true"/"false" (also yes/no, 1/0). nullopt on anything else.
std::optional<bool> parse_bool(const std::string& s);

/// Convert enum to string
std::string to_string(FlowCategory category);
std::string to_string(BalanceStatus status);

/// Convert string to enum
FlowCategory category_from_string(const std::string& s);

} // namespace config_io

} // namespace wbc
