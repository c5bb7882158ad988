/**
 * @file config_editor.cpp
 * @brief Flow selection controller
 */

#include "wbc/editor/config_editor.hpp"
#include <algorithm>
#include <stdexcept>

namespace wbc {

ConfigEditor::ConfigEditor(const FlowCatalog& catalog, FlowConfigStore& store)
    : catalog_(catalog), store_(store) {
    reload();
}

void ConfigEditor::reload() {
    const FlowConfig loaded = store_.load();
    const auto& defs = catalog_.definitions();

    enabled_.assign(defs.size(), true);
    for (Size i = 0; i < defs.size(); ++i) {
        auto it = loaded.find(defs[i].code);
        if (it != loaded.end()) {
            enabled_[i] = it->second;
        }
    }

    stale_codes_.clear();
    for (const auto& [code, enabled] : loaded) {
        if (!catalog_.contains(code)) {
            stale_codes_.push_back(code);
        }
    }
    std::sort(stale_codes_.begin(), stale_codes_.end());

    dirty_ = false;
}

std::vector<CategoryListing> ConfigEditor::list_by_category() const {
    std::vector<CategoryListing> listing;
    listing.reserve(ALL_CATEGORIES.size());

    for (FlowCategory category : ALL_CATEGORIES) {
        CategoryListing group;
        group.category = category;
        listing.push_back(std::move(group));
    }

    const auto& defs = catalog_.definitions();
    for (Size i = 0; i < defs.size(); ++i) {
        auto& group = listing[static_cast<Size>(category_index(defs[i].category))];
        group.flows.push_back({&defs[i], static_cast<bool>(enabled_[i])});
    }

    return listing;
}

Size ConfigEditor::require_index(const std::string& code) const {
    const Index idx = catalog_.index_of(code);
    if (idx < 0) {
        throw std::invalid_argument("Invalid flow code (not in catalog): " + code);
    }
    return static_cast<Size>(idx);
}

void ConfigEditor::toggle(const std::string& code) {
    const Size idx = require_index(code);
    enabled_[idx] = !enabled_[idx];
    dirty_ = true;
}

void ConfigEditor::set_enabled(const std::string& code, bool enabled) {
    const Size idx = require_index(code);
    if (enabled_[idx] != enabled) {
        enabled_[idx] = enabled;
        dirty_ = true;
    }
}

void ConfigEditor::set_category_enabled(FlowCategory category, bool enabled) {
    const auto& defs = catalog_.definitions();
    for (Size i = 0; i < defs.size(); ++i) {
        if (defs[i].category == category && enabled_[i] != enabled) {
            enabled_[i] = enabled;
            dirty_ = true;
        }
    }
}

bool ConfigEditor::is_enabled(const std::string& code) const {
    return enabled_[require_index(code)];
}

std::vector<std::string> ConfigEditor::enabled_codes() const {
    std::vector<std::string> codes;
    const auto& defs = catalog_.definitions();
    for (Size i = 0; i < defs.size(); ++i) {
        if (enabled_[i]) codes.push_back(defs[i].code);
    }
    return codes;
}

FlowConfig ConfigEditor::current() const {
    FlowConfig config;
    const auto& defs = catalog_.definitions();
    for (Size i = 0; i < defs.size(); ++i) {
        config[defs[i].code] = enabled_[i];
    }
    return config;
}

bool ConfigEditor::commit() {
    if (!store_.save(current())) {
        return false;
    }
    stale_codes_.clear();
    dirty_ = false;
    return true;
}

} // namespace wbc
