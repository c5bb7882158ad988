/**
 * @file catalog.hpp
 * @brief Flow catalog: the authoritative list of known flows
 *
 * The catalog is built once (in code or from a catalog template file)
 * and never mutated afterwards. Declaration order is preserved and is
 * the order used for editor listings and per-area reports.
 */

#pragma once

#include "types.hpp"
#include <filesystem>
#include <iosfwd>

namespace wbc {

/**
 * @brief Immutable, ordered collection of flow definitions
 *
 * Example catalog template:
 * @code
 * [inflows]
 * area: NDCD1-4
 * MERN_RAIN (Rainfall on decline) = 12 345 m3
 *
 * [outflows]
 * OT_EVAP (Dam evaporation) = 4,200 m3
 * @endcode
 */
class FlowCatalog {
public:
    FlowCatalog() = default;

    /**
     * @brief Build from definitions
     *
     * @throws std::invalid_argument on an empty or duplicate code
     */
    explicit FlowCatalog(std::vector<FlowDefinition> definitions);

    /**
     * @brief Load from a catalog template file
     *
     * @param filepath Template path
     * @param verbose  Report skipped lines on stderr
     */
    static FlowCatalog from_file(const std::filesystem::path& filepath, bool verbose = false);

    /// Parse template text (see from_file)
    static FlowCatalog parse(std::istream& is, bool verbose = false);

    /// Write in template format
    void to_file(const std::filesystem::path& filepath) const;

    // ========================================================================
    // Lookup
    // ========================================================================

    /// Definition for a code, nullptr if unknown
    const FlowDefinition* find(const std::string& code) const;

    bool contains(const std::string& code) const { return index_.count(code) > 0; }

    /// Position of a code in declaration order, -1 if unknown
    Index index_of(const std::string& code) const;

    const std::vector<FlowDefinition>& definitions() const { return definitions_; }

    /// Definitions of one category, declaration order
    std::vector<const FlowDefinition*> by_category(FlowCategory category) const;

    /// Distinct areas in order of first appearance
    const std::vector<std::string>& areas() const { return areas_; }

    /// Position of an area in areas(), -1 if unknown
    Index area_index(const std::string& area) const;

    Size size() const { return definitions_.size(); }
    bool empty() const { return definitions_.empty(); }

    // ========================================================================
    // Derived data
    // ========================================================================

    /// Nominal volumes in declaration order
    Vector nominal_volumes() const;

    /// One measurement per definition, valued at its nominal volume
    MeasuredFlows nominal_measurements() const;

private:
    std::vector<FlowDefinition> definitions_;
    std::unordered_map<std::string, Index> index_;
    std::vector<std::string> areas_;
    std::unordered_map<std::string, Index> area_index_;
};

namespace catalog_io {

/**
 * @brief Parse a template data line `CODE (Name) = 12 345 m3`
 *
 * @return false if the line does not hold a code and a numeric value
 */
bool parse_flow_line(const std::string& line, std::string& code,
                     std::string& name, Real& value);

/// Section header (`[inflows]`) to category; nullopt if not a known header
std::optional<FlowCategory> parse_section(const std::string& line);

} // namespace catalog_io

} // namespace wbc
