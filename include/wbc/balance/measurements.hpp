/**
 * @file measurements.hpp
 * @brief Measured flow volumes exchanged with external loaders
 *
 * Spreadsheet import lives outside this library; loaders hand over
 * (code, value) pairs directly or through a two-column CSV file.
 */

#pragma once

#include "../core/types.hpp"
#include <filesystem>
#include <iosfwd>

namespace wbc {
namespace measurements_io {

/**
 * @brief Read `code,value` rows
 *
 * The first line is a header. Blank lines are skipped.
 *
 * @throws std::runtime_error if the file cannot be opened or a row is
 *         malformed (message names the line number)
 */
MeasuredFlows read_csv(const std::filesystem::path& filepath);

/// Stream variant of read_csv
MeasuredFlows read_csv(std::istream& is);

/// Write `code,value` rows with header
void write_csv(const std::filesystem::path& filepath, const MeasuredFlows& flows);

/// Sum of all values
Real total(const MeasuredFlows& flows);

} // namespace measurements_io
} // namespace wbc
