/**
 * @file catalog.cpp
 * @brief Flow catalog construction and template parsing
 */

#include "wbc/core/catalog.hpp"
#include "wbc/core/config.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace wbc {

namespace {

// '#' starts a comment only at line start or after whitespace (keeps "BH#3")
std::string strip_comment(const std::string& line) {
    for (Size i = 0; i < line.size(); ++i) {
        if (line[i] == '#' &&
            (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

} // namespace

FlowCatalog::FlowCatalog(std::vector<FlowDefinition> definitions)
    : definitions_(std::move(definitions)) {
    for (Size i = 0; i < definitions_.size(); ++i) {
        const auto& def = definitions_[i];
        if (def.code.empty()) {
            throw std::invalid_argument("Flow definition with empty code");
        }
        if (!index_.emplace(def.code, static_cast<Index>(i)).second) {
            throw std::invalid_argument("Duplicate flow code in catalog: " + def.code);
        }
        if (area_index_.emplace(def.area, static_cast<Index>(areas_.size())).second) {
            areas_.push_back(def.area);
        }
    }
}

FlowCatalog FlowCatalog::from_file(const std::filesystem::path& filepath, bool verbose) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open catalog template: " + filepath.string());
    }
    return parse(file, verbose);
}

FlowCatalog FlowCatalog::parse(std::istream& is, bool verbose) {
    std::vector<FlowDefinition> definitions;
    std::optional<FlowCategory> category;
    std::string area = "UNKNOWN";

    std::string line;
    int line_number = 0;

    while (std::getline(is, line)) {
        ++line_number;

        line = config_io::trim(strip_comment(line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            category = catalog_io::parse_section(line);
            if (!category) {
                throw std::runtime_error("Unknown catalog section at line " +
                                         std::to_string(line_number) + ": " + line);
            }
            area = "UNKNOWN";
            continue;
        }

        if (line.rfind("area:", 0) == 0) {
            area = config_io::trim(line.substr(5));
            if (area.empty()) area = "UNKNOWN";
            continue;
        }

        FlowDefinition def;
        if (!catalog_io::parse_flow_line(line, def.code, def.name, def.nominal_volume)) {
            if (verbose) {
                std::cerr << "Catalog line " << line_number << " skipped: " << line << "\n";
            }
            continue;
        }

        if (!category) {
            throw std::runtime_error("Catalog flow before any section header at line " +
                                     std::to_string(line_number));
        }

        def.category = *category;
        def.area = area;
        definitions.push_back(std::move(def));
    }

    return FlowCatalog(std::move(definitions));
}

void FlowCatalog::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write catalog template: " + filepath.string());
    }

    file << "# wbc Flow Catalog\n";
    file << std::fixed << std::setprecision(3);

    for (FlowCategory category : ALL_CATEGORIES) {
        auto defs = by_category(category);
        if (defs.empty()) continue;

        switch (category) {
            case FlowCategory::Inflow: file << "\n[inflows]\n"; break;
            case FlowCategory::Recirculation: file << "\n[recirculation]\n"; break;
            case FlowCategory::Outflow: file << "\n[outflows]\n"; break;
        }

        std::string current_area = "UNKNOWN";
        for (const auto* def : defs) {
            if (def->area != current_area) {
                current_area = def->area;
                file << "area: " << current_area << "\n";
            }
            file << def->code << " (" << def->name << ") = " << def->nominal_volume << " m3\n";
        }
    }
}

const FlowDefinition* FlowCatalog::find(const std::string& code) const {
    auto it = index_.find(code);
    if (it == index_.end()) return nullptr;
    return &definitions_[static_cast<Size>(it->second)];
}

Index FlowCatalog::index_of(const std::string& code) const {
    auto it = index_.find(code);
    return it == index_.end() ? -1 : it->second;
}

std::vector<const FlowDefinition*> FlowCatalog::by_category(FlowCategory category) const {
    std::vector<const FlowDefinition*> out;
    for (const auto& def : definitions_) {
        if (def.category == category) {
            out.push_back(&def);
        }
    }
    return out;
}

Index FlowCatalog::area_index(const std::string& area) const {
    auto it = area_index_.find(area);
    return it == area_index_.end() ? -1 : it->second;
}

Vector FlowCatalog::nominal_volumes() const {
    Vector volumes(static_cast<Index>(definitions_.size()));
    for (Size i = 0; i < definitions_.size(); ++i) {
        volumes(static_cast<Index>(i)) = definitions_[i].nominal_volume;
    }
    return volumes;
}

MeasuredFlows FlowCatalog::nominal_measurements() const {
    MeasuredFlows measured;
    measured.reserve(definitions_.size());
    for (const auto& def : definitions_) {
        measured.push_back({def.code, def.nominal_volume});
    }
    return measured;
}

// ============================================================================
// catalog_io helpers
// ============================================================================

namespace catalog_io {

bool parse_flow_line(const std::string& line, std::string& code,
                     std::string& name, Real& value) {
    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return false;

    const std::string left = config_io::trim(line.substr(0, eq_pos));
    const std::string right = config_io::trim(line.substr(eq_pos + 1));
    if (left.empty() || right.empty()) return false;

    // Code is the first token, up to whitespace or '('
    auto code_end = left.find_first_of(" \t(");
    code = left.substr(0, code_end);
    if (code.empty()) return false;

    name = code;
    auto open = left.find('(');
    auto close = left.rfind(')');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        std::string inner = config_io::trim(left.substr(open + 1, close - open - 1));
        if (!inner.empty()) name = inner;
    }

    // Skip leading non-digits ("~12 345 m3"), keeping a sign directly before the number
    auto start = right.find_first_of("0123456789");
    if (start == std::string::npos) return false;
    if (start > 0 && right[start - 1] == '.') --start;

    // Digits with ',' or ' ' as thousands separators; stop at the first other char
    std::string digits;
    if (start > 0 && right[start - 1] == '-') {
        digits += '-';
    }
    for (char c : right.substr(start)) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            digits += c;
        } else if (c == ',' || c == ' ') {
            continue;
        } else {
            break;
        }
    }
    if (digits.empty()) return false;

    try {
        value = std::stod(digits);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::optional<FlowCategory> parse_section(const std::string& line) {
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
        return std::nullopt;
    }
    const std::string name = config_io::trim(line.substr(1, line.size() - 2));
    try {
        return config_io::category_from_string(name);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

} // namespace catalog_io

} // namespace wbc
