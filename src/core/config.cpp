/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "wbc/core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace wbc {

// ============================================================================
// BalanceConfig
// ============================================================================

BalanceStatus BalanceConfig::classify(std::optional<Real> error_percent) const {
    if (!error_percent) return BalanceStatus::Undefined;

    const Real error = std::abs(*error_percent);
    if (error < excellent_threshold) return BalanceStatus::Excellent;
    if (error < good_threshold) return BalanceStatus::Good;
    return BalanceStatus::Check;
}

bool BalanceConfig::validate() const {
    if (excellent_threshold <= 0.0) return false;
    if (good_threshold <= excellent_threshold) return false;
    return true;
}

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    Config config;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }

    const auto base_dir = filepath.parent_path();
    auto resolve = [&](const std::string& value) {
        std::filesystem::path p(value);
        return p.is_relative() ? base_dir / p : p;
    };

    std::string current_section;

    for (const auto& kv : config_io::tokenize(file)) {
        if (kv.key.empty()) continue;

        if (kv.value.empty()) {
            // Section header
            current_section = kv.key;
            continue;
        }

        const std::string& key = kv.key;
        const std::string& value = kv.value;

        if (current_section == "balance") {
            if (key == "excellent_threshold")
                config.balance.excellent_threshold = std::stod(value);
            else if (key == "good_threshold")
                config.balance.good_threshold = std::stod(value);
            else if (key == "verbose")
                config.balance.verbose = config_io::parse_bool(value).value_or(false);
        } else if (current_section == "files" || current_section.empty()) {
            if (key == "catalog_file")
                config.catalog_file = resolve(value);
            else if (key == "flow_config_file")
                config.flow_config_file = resolve(value);
            else if (key == "measurements_file")
                config.measurements_file = resolve(value);
        }
    }

    return config;
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }

    file << "# wbc Configuration File\n\n";

    file << "files:\n";
    file << "  catalog_file: " << catalog_file.string() << "\n";
    file << "  flow_config_file: " << flow_config_file.string() << "\n";
    if (!measurements_file.empty()) {
        file << "  measurements_file: " << measurements_file.string() << "\n";
    }
    file << "\n";

    file << "balance:\n";
    file << "  excellent_threshold: " << balance.excellent_threshold << "\n";
    file << "  good_threshold: " << balance.good_threshold << "\n";
    file << "  verbose: " << (balance.verbose ? "true" : "false") << "\n";
}

bool Config::validate() const {
    if (!balance.validate()) return false;
    if (flow_config_file.empty()) return false;
    return true;
}

void Config::print_summary(std::ostream& os) const {
    os << "=== wbc Configuration ===\n";
    os << "Files:\n";
    os << "  Catalog:      " << (catalog_file.empty() ? "(built-in)" : catalog_file.string()) << "\n";
    os << "  Flow config:  " << flow_config_file.string() << "\n";
    if (!measurements_file.empty()) {
        os << "  Measurements: " << measurements_file.string() << "\n";
    }
    os << "Balance:\n";
    os << "  Excellent < " << balance.excellent_threshold << " %\n";
    os << "  Good      < " << balance.good_threshold << " %\n";
    os << "=========================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<KeyValueLine> tokenize(std::istream& is) {
    std::vector<KeyValueLine> lines;
    std::string line;
    int line_number = 0;

    while (std::getline(is, line)) {
        ++line_number;

        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        if (trim(line).empty()) continue;

        KeyValueLine kv;
        kv.indent = static_cast<int>(start);
        kv.line_number = line_number;

        auto colon_pos = line.find(':', start);
        if (colon_pos == std::string::npos) {
            kv.value = trim(line);
        } else {
            kv.key = trim(line.substr(start, colon_pos - start));
            kv.value = trim(line.substr(colon_pos + 1));
        }
        lines.push_back(std::move(kv));
    }

    return lines;
}

std::optional<bool> parse_bool(const std::string& s) {
    std::string lower = trim(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

std::string to_string(FlowCategory category) {
    switch (category) {
        case FlowCategory::Inflow: return "Inflow";
        case FlowCategory::Recirculation: return "Recirculation";
        case FlowCategory::Outflow: return "Outflow";
    }
    return "Unknown";
}

std::string to_string(BalanceStatus status) {
    switch (status) {
        case BalanceStatus::Excellent: return "Excellent";
        case BalanceStatus::Good: return "Good";
        case BalanceStatus::Check: return "Check";
        case BalanceStatus::Undefined: return "N/A";
    }
    return "Unknown";
}

FlowCategory category_from_string(const std::string& s) {
    if (s == "Inflow" || s == "inflow" || s == "inflows") return FlowCategory::Inflow;
    if (s == "Recirculation" || s == "recirculation") return FlowCategory::Recirculation;
    if (s == "Outflow" || s == "outflow" || s == "outflows") return FlowCategory::Outflow;
    throw std::invalid_argument("Unknown flow category: " + s);
}

} // namespace config_io

} // namespace wbc
