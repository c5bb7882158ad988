/**
 * @file wbc.hpp
 * @brief Main wbc balance check class
 *
 * Primary interface for the water balance check core. It ties together
 * the flow catalog, the flow configuration store, the configuration
 * editor and the balance engine, and provides a clean API for:
 * - Balance calculation from measured or nominal volumes
 * - Selecting which flows are included
 * - Use from the Python desktop application (see python/wbc)
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/config.hpp"
#include "core/catalog.hpp"

// Store / editor includes
#include "store/flow_config_store.hpp"
#include "editor/config_editor.hpp"

// Balance includes
#include "balance/balance_engine.hpp"
#include "balance/measurements.hpp"

namespace wbc {

/**
 * @brief Balance check session
 *
 * Example usage:
 * @code
 * auto check = BalanceCheck::from_config("wbc.yaml");
 *
 * // Exclude a flow and persist the choice
 * check.editor().toggle("OT_EVAP");
 * check.editor().commit();
 *
 * // Calculate with the measured volumes of the period
 * auto result = check.calculate(measurements_io::read_csv("march.csv"));
 * print_summary(result, std::cout);
 * @endcode
 */
class BalanceCheck {
public:
    /**
     * @brief Create from parts
     *
     * @throws std::invalid_argument if store is null
     */
    BalanceCheck(FlowCatalog catalog, UniquePtr<FlowConfigStore> store,
                 BalanceConfig settings = {});
    ~BalanceCheck();

    // No copy (editor and engine reference owned members)
    BalanceCheck(const BalanceCheck&) = delete;
    BalanceCheck& operator=(const BalanceCheck&) = delete;

    // Move OK
    BalanceCheck(BalanceCheck&&) noexcept;
    BalanceCheck& operator=(BalanceCheck&&) noexcept;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create from configuration file
     */
    static BalanceCheck from_config(const std::string& config_file);

    /**
     * @brief Create from config object
     *
     * @throws std::runtime_error if no catalog file is configured
     */
    static BalanceCheck from_config(const Config& config);

    // ========================================================================
    // Calculation
    // ========================================================================

    /**
     * @brief Compute balance with the currently stored enable flags
     *
     * The flow configuration is read from the store on every call.
     */
    BalanceResult calculate(const MeasuredFlows& measured, Real storage_change = 0.0);

    /// Compute balance from the catalog's nominal volumes
    BalanceResult calculate_nominal(Real storage_change = 0.0);

    /// Compute balance from a measurements CSV file
    BalanceResult calculate_file(const std::filesystem::path& measurements_file,
                                 Real storage_change = 0.0);

    /// Result of the last calculation, if any
    const std::optional<BalanceResult>& last_result() const { return last_result_; }

    /**
     * @brief Reload the catalog template and recompute nominal balance
     *
     * The catalog and editor are reloaded in place, so references
     * obtained from catalog() and editor() stay valid. Uncommitted
     * edits are discarded.
     *
     * @throws std::runtime_error if the session has no catalog file
     */
    BalanceResult refresh();

    // ========================================================================
    // Access
    // ========================================================================

    /**
     * @brief Flow selection editor (created on first use)
     */
    ConfigEditor& editor();

    const FlowCatalog& catalog() const { return *catalog_; }
    FlowConfigStore& store() { return *store_; }
    const BalanceEngine& engine() const { return *engine_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    Ptr<FlowCatalog> catalog_;
    UniquePtr<FlowConfigStore> store_;
    UniquePtr<BalanceEngine> engine_;
    UniquePtr<ConfigEditor> editor_;
    std::optional<BalanceResult> last_result_;
};

} // namespace wbc
