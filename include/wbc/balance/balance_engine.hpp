/**
 * @file balance_engine.hpp
 * @brief Water balance aggregation over enabled flows
 *
 * Balance equation:
 *   delta = inflow - outflow - recirculation - storage_change
 *   error = |delta| / inflow * 100   (N/A when inflow is zero)
 *
 * Only measured flows that are known to the catalog and not disabled
 * in the flow configuration contribute. Unknown codes are skipped with
 * a warning; the calculation never aborts because of them.
 */

#pragma once

#include "../core/catalog.hpp"
#include "../core/config.hpp"
#include <iosfwd>

namespace wbc {

class FlowConfigStore;

/**
 * @brief Category totals and derived balance figures
 */
struct BalanceTotals {
    Real total_inflow = 0.0;            ///< [m³]
    Real total_outflow = 0.0;           ///< [m³]
    Real total_recirculation = 0.0;     ///< [m³]
    Real storage_change = 0.0;          ///< [m³] positive = storage gained

    Index inflow_count = 0;
    Index outflow_count = 0;
    Index recirculation_count = 0;

    Real delta = 0.0;                   ///< [m³]
    std::optional<Real> error_percent;  ///< [%] empty when total_inflow is zero
    BalanceStatus status = BalanceStatus::Undefined;

    /// Error below the "good" threshold
    bool is_balanced() const {
        return status == BalanceStatus::Excellent || status == BalanceStatus::Good;
    }

    Real total(FlowCategory category) const;
    Index count(FlowCategory category) const;
};

/**
 * @brief Balance of one site area
 */
struct AreaBalance : BalanceTotals {
    std::string area;
};

/**
 * @brief Result of one balance calculation
 */
struct BalanceResult : BalanceTotals {
    std::vector<AreaBalance> areas;             ///< Catalog area order
    std::vector<std::string> skipped_codes;     ///< Measured but not in catalog
    std::vector<std::string> excluded_codes;    ///< Measured but disabled

    /// Area result by name, nullptr if unknown
    const AreaBalance* area(const std::string& name) const;
};

/**
 * @brief Computes balances for a fixed catalog
 */
class BalanceEngine {
public:
    /// The catalog must outlive the engine
    explicit BalanceEngine(const FlowCatalog& catalog, BalanceConfig settings = {});

    /**
     * @brief Compute the balance of one measurement set
     *
     * @param measured       Measured volumes (read-only)
     * @param config         Enable flags; absent codes are enabled
     * @param storage_change Site storage change over the period [m³]
     */
    BalanceResult calculate(const MeasuredFlows& measured,
                            const FlowConfig& config,
                            Real storage_change = 0.0) const;

    /// Same, reading the enable flags from a store
    BalanceResult calculate(const MeasuredFlows& measured,
                            const FlowConfigStore& store,
                            Real storage_change = 0.0) const;

    const BalanceConfig& settings() const { return settings_; }
    const FlowCatalog& catalog() const { return catalog_; }

private:
    const FlowCatalog& catalog_;
    BalanceConfig settings_;

    void finalize(BalanceTotals& totals) const;
};

// ============================================================================
// Reporting
// ============================================================================

/// Compact volume label: 1.23M, 45.6K, 789
std::string format_volume(Real value);

/// Human-readable balance report
void print_summary(const BalanceResult& result, std::ostream& os);

} // namespace wbc
