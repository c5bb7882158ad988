/**
 * @file balance_check.cpp
 * @brief Implementation of the BalanceCheck session
 */

#include "wbc/wbc.hpp"
#include <iostream>
#include <stdexcept>

namespace wbc {

BalanceCheck::BalanceCheck(FlowCatalog catalog, UniquePtr<FlowConfigStore> store,
                           BalanceConfig settings)
    : catalog_(std::make_shared<FlowCatalog>(std::move(catalog))),
      store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("BalanceCheck requires a flow config store");
    }
    config_.balance = settings;
    engine_ = std::make_unique<BalanceEngine>(*catalog_, settings);
}

BalanceCheck::~BalanceCheck() = default;
BalanceCheck::BalanceCheck(BalanceCheck&&) noexcept = default;
BalanceCheck& BalanceCheck::operator=(BalanceCheck&&) noexcept = default;

BalanceCheck BalanceCheck::from_config(const std::string& config_file) {
    Config config = Config::from_file(config_file);
    return from_config(config);
}

BalanceCheck BalanceCheck::from_config(const Config& config) {
    if (!config.validate()) {
        throw std::runtime_error("Invalid balance check configuration");
    }
    if (config.catalog_file.empty()) {
        throw std::runtime_error("No catalog_file configured");
    }

    BalanceCheck check(FlowCatalog::from_file(config.catalog_file, config.balance.verbose),
                       std::make_unique<FileFlowConfigStore>(config.flow_config_file,
                                                             config.balance.verbose),
                       config.balance);
    check.config_ = config;

    if (config.balance.verbose) {
        config.print_summary(std::cerr);
    }
    return check;
}

BalanceResult BalanceCheck::calculate(const MeasuredFlows& measured, Real storage_change) {
    last_result_ = engine_->calculate(measured, *store_, storage_change);
    return *last_result_;
}

BalanceResult BalanceCheck::calculate_nominal(Real storage_change) {
    return calculate(catalog_->nominal_measurements(), storage_change);
}

BalanceResult BalanceCheck::calculate_file(const std::filesystem::path& measurements_file,
                                           Real storage_change) {
    return calculate(measurements_io::read_csv(measurements_file), storage_change);
}

BalanceResult BalanceCheck::refresh() {
    if (config_.catalog_file.empty()) {
        throw std::runtime_error("Cannot refresh: no catalog file for this session");
    }

    if (config_.balance.verbose) {
        std::cerr << "Reloading catalog " << config_.catalog_file << "\n";
    }

    // Load first so a bad template leaves the session untouched
    FlowCatalog catalog = FlowCatalog::from_file(config_.catalog_file, config_.balance.verbose);

    // Replace in place: engine and editor keep referring to the same objects
    *catalog_ = std::move(catalog);
    if (editor_) {
        editor_->reload();
    }

    return calculate_nominal();
}

ConfigEditor& BalanceCheck::editor() {
    if (!editor_) {
        editor_ = std::make_unique<ConfigEditor>(*catalog_, *store_);
    }
    return *editor_;
}

} // namespace wbc
