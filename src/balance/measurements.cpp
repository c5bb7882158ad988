/**
 * @file measurements.cpp
 * @brief CSV exchange of measured flow volumes
 */

#include "wbc/balance/measurements.hpp"
#include "wbc/core/config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wbc {
namespace measurements_io {

MeasuredFlows read_csv(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open measurements file: " + filepath.string());
    }
    return read_csv(file);
}

MeasuredFlows read_csv(std::istream& is) {
    MeasuredFlows flows;

    std::string line;
    if (!std::getline(is, line)) {
        return flows;
    }
    int line_number = 1;

    // Header must be "code,value" (case and spaces ignored)
    std::string header;
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            header += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (header != "code,value") {
        throw std::runtime_error("Missing 'code,value' header at line 1: " + line);
    }

    while (std::getline(is, line)) {
        ++line_number;
        if (config_io::trim(line).empty()) continue;

        auto comma = line.find(',');
        if (comma == std::string::npos) {
            throw std::runtime_error("Malformed measurement at line " +
                                     std::to_string(line_number) + ": " + line);
        }

        MeasuredFlow flow;
        flow.code = config_io::trim(line.substr(0, comma));
        const std::string value = config_io::trim(line.substr(comma + 1));

        size_t consumed = 0;
        try {
            flow.value = std::stod(value, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (flow.code.empty() || consumed == 0 || consumed != value.size()) {
            throw std::runtime_error("Malformed measurement at line " +
                                     std::to_string(line_number) + ": " + line);
        }

        flows.push_back(std::move(flow));
    }

    return flows;
}

void write_csv(const std::filesystem::path& filepath, const MeasuredFlows& flows) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open measurements file for writing: " + filepath.string());
    }

    file << "code,value\n";
    file.precision(17);
    for (const auto& flow : flows) {
        file << flow.code << "," << flow.value << "\n";
    }
}

Real total(const MeasuredFlows& flows) {
    Real sum = 0.0;
    for (const auto& flow : flows) {
        sum += flow.value;
    }
    return sum;
}

} // namespace measurements_io
} // namespace wbc
