/**
 * @file config_editor.hpp
 * @brief UI-agnostic controller for choosing which flows enter the balance
 *
 * The editor presents the catalog grouped by category together with the
 * current enable state, applies toggles in memory and persists the
 * result through a FlowConfigStore on commit(). Rendering is left to
 * the caller.
 */

#pragma once

#include "../core/catalog.hpp"
#include "../store/flow_config_store.hpp"
#include <utility>

namespace wbc {

/**
 * @brief A catalog flow with its current enable state
 */
struct FlowSelection {
    const FlowDefinition* definition = nullptr;
    bool enabled = true;
};

/**
 * @brief Flows of one category, in catalog order
 */
struct CategoryListing {
    FlowCategory category = FlowCategory::Inflow;
    std::vector<FlowSelection> flows;
};

class ConfigEditor {
public:
    /**
     * @brief Create editor and load current flags from the store
     *
     * Both references must outlive the editor.
     */
    ConfigEditor(const FlowCatalog& catalog, FlowConfigStore& store);

    /// Categories in order Inflow, Recirculation, Outflow
    std::vector<CategoryListing> list_by_category() const;

    /**
     * @brief Flip the enable state of one flow
     *
     * @throws std::invalid_argument if the code is not in the catalog
     */
    void toggle(const std::string& code);

    /// Set the enable state of one flow (same error as toggle)
    void set_enabled(const std::string& code, bool enabled);

    /// Enable or disable every flow of a category
    void set_category_enabled(FlowCategory category, bool enabled);

    /// @throws std::invalid_argument if the code is not in the catalog
    bool is_enabled(const std::string& code) const;

    /// Enabled codes in catalog order
    std::vector<std::string> enabled_codes() const;

    /// Full mapping for every catalog code
    FlowConfig current() const;

    /// Codes in the loaded config that the catalog does not know
    const std::vector<std::string>& stale_codes() const { return stale_codes_; }

    /// True when in-memory state differs from the last load/commit
    bool is_dirty() const { return dirty_; }

    /**
     * @brief Persist the full mapping to the store
     *
     * Stale codes are not written back.
     *
     * @return false if the store rejected the save; state stays dirty
     */
    bool commit();

    /// Discard in-memory changes and reload from the store
    void reload();

private:
    const FlowCatalog& catalog_;
    FlowConfigStore& store_;

    std::vector<bool> enabled_;     ///< Indexed by catalog position
    std::vector<std::string> stale_codes_;
    bool dirty_ = false;

    Size require_index(const std::string& code) const;
};

} // namespace wbc
