/**
 * @file balance_engine.cpp
 * @brief Water balance aggregation
 */

#include "wbc/balance/balance_engine.hpp"
#include "wbc/store/flow_config_store.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wbc {

namespace {

void push_unique(std::vector<std::string>& codes, const std::string& code) {
    if (std::find(codes.begin(), codes.end(), code) == codes.end()) {
        codes.push_back(code);
    }
}

} // namespace

// ============================================================================
// BalanceTotals
// ============================================================================

Real BalanceTotals::total(FlowCategory category) const {
    switch (category) {
        case FlowCategory::Inflow: return total_inflow;
        case FlowCategory::Recirculation: return total_recirculation;
        case FlowCategory::Outflow: return total_outflow;
    }
    return 0.0;
}

Index BalanceTotals::count(FlowCategory category) const {
    switch (category) {
        case FlowCategory::Inflow: return inflow_count;
        case FlowCategory::Recirculation: return recirculation_count;
        case FlowCategory::Outflow: return outflow_count;
    }
    return 0;
}

const AreaBalance* BalanceResult::area(const std::string& name) const {
    for (const auto& a : areas) {
        if (a.area == name) return &a;
    }
    return nullptr;
}

// ============================================================================
// BalanceEngine
// ============================================================================

BalanceEngine::BalanceEngine(const FlowCatalog& catalog, BalanceConfig settings)
    : catalog_(catalog), settings_(settings) {}

BalanceResult BalanceEngine::calculate(const MeasuredFlows& measured,
                                       const FlowConfigStore& store,
                                       Real storage_change) const {
    return calculate(measured, store.load(), storage_change);
}

BalanceResult BalanceEngine::calculate(const MeasuredFlows& measured,
                                       const FlowConfig& config,
                                       Real storage_change) const {
    BalanceResult result;

    const auto& areas = catalog_.areas();
    const Index n_areas = static_cast<Index>(areas.size());

    // areas x categories
    Matrix volumes = Matrix::Zero(n_areas, N_CATEGORIES);
    MatrixI counts = MatrixI::Zero(n_areas, N_CATEGORIES);

    for (const auto& flow : measured) {
        const FlowDefinition* def = catalog_.find(flow.code);
        if (def == nullptr) {
            if (settings_.verbose) {
                std::cerr << "Warning: unknown flow code '" << flow.code
                          << "' skipped (" << flow.value << " m3)\n";
            }
            push_unique(result.skipped_codes, flow.code);
            continue;
        }

        auto it = config.find(flow.code);
        const bool enabled = (it == config.end()) ? true : it->second;
        if (!enabled) {
            push_unique(result.excluded_codes, flow.code);
            continue;
        }

        const Index a = catalog_.area_index(def->area);
        const Index c = category_index(def->category);
        volumes(a, c) += flow.value;
        counts(a, c) += 1;
    }

    auto fill = [](BalanceTotals& t, const auto& v, const auto& n) {
        t.total_inflow = v(category_index(FlowCategory::Inflow));
        t.total_recirculation = v(category_index(FlowCategory::Recirculation));
        t.total_outflow = v(category_index(FlowCategory::Outflow));
        t.inflow_count = n(category_index(FlowCategory::Inflow));
        t.recirculation_count = n(category_index(FlowCategory::Recirculation));
        t.outflow_count = n(category_index(FlowCategory::Outflow));
    };

    const Eigen::RowVectorXd site_volumes = volumes.colwise().sum();
    const Eigen::Matrix<Index, 1, Eigen::Dynamic> site_counts = counts.colwise().sum();
    fill(result, site_volumes, site_counts);
    result.storage_change = storage_change;
    finalize(result);

    result.areas.reserve(areas.size());
    for (Index a = 0; a < n_areas; ++a) {
        AreaBalance area;
        area.area = areas[static_cast<Size>(a)];
        const Eigen::RowVectorXd row = volumes.row(a);
        const Eigen::Matrix<Index, 1, Eigen::Dynamic> row_counts = counts.row(a);
        fill(area, row, row_counts);
        finalize(area);
        result.areas.push_back(std::move(area));
    }

    if (settings_.verbose && !result.skipped_codes.empty()) {
        std::cerr << "Warning: " << result.skipped_codes.size()
                  << " measured flow(s) not in catalog were excluded\n";
    }

    return result;
}

void BalanceEngine::finalize(BalanceTotals& t) const {
    t.delta = t.total_inflow - t.total_outflow - t.total_recirculation - t.storage_change;

    if (t.total_inflow > constants::EPSILON) {
        t.error_percent = std::abs(t.delta) / t.total_inflow * 100.0;
    } else {
        t.error_percent.reset();
    }
    t.status = settings_.classify(t.error_percent);
}

// ============================================================================
// Reporting
// ============================================================================

std::string format_volume(Real value) {
    std::ostringstream ss;
    ss << std::fixed;
    if (std::abs(value) >= 1'000'000.0) {
        ss << std::setprecision(2) << value / 1'000'000.0 << "M";
    } else if (std::abs(value) >= 1'000.0) {
        ss << std::setprecision(1) << value / 1'000.0 << "K";
    } else {
        ss << std::setprecision(0) << value;
    }
    return ss.str();
}

void print_summary(const BalanceResult& result, std::ostream& os) {
    const std::string rule(70, '=');
    const std::string thin(70, '-');
    const auto saved_flags = os.flags();
    const auto saved_precision = os.precision();

    auto error_text = [](const BalanceTotals& t) {
        if (!t.error_percent) return std::string("N/A");
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << *t.error_percent << " %";
        return ss.str();
    };

    os << rule << "\n";
    os << "WATER BALANCE CHECK SUMMARY\n";
    os << rule << "\n";
    os << std::fixed << std::setprecision(0);
    os << "Total Inflows:       " << std::setw(16) << result.total_inflow
       << " m3 (" << result.inflow_count << " sources)\n";
    os << "Total Outflows:      " << std::setw(16) << result.total_outflow
       << " m3 (" << result.outflow_count << " flows)\n";
    os << "Total Recirculation: " << std::setw(16) << result.total_recirculation
       << " m3 (" << result.recirculation_count << " loops)\n";
    if (result.storage_change != 0.0) {
        os << "Storage Change:      " << std::setw(16) << result.storage_change << " m3\n";
    }
    os << thin << "\n";
    os << "Balance Difference:  " << std::setw(16) << result.delta << " m3\n";
    os << "Balance Error:       " << std::setw(16) << error_text(result) << "\n";
    os << "Status:              " << config_io::to_string(result.status) << "\n";

    if (!result.areas.empty()) {
        os << thin << "\n";
        for (const auto& area : result.areas) {
            os << std::left << std::setw(14) << area.area << std::right
               << " in " << std::setw(8) << format_volume(area.total_inflow)
               << "  out " << std::setw(8) << format_volume(area.total_outflow)
               << "  recirc " << std::setw(8) << format_volume(area.total_recirculation)
               << "  error " << std::setw(9) << error_text(area)
               << "  " << config_io::to_string(area.status) << "\n";
        }
    }

    if (!result.excluded_codes.empty()) {
        os << thin << "\n";
        os << "Excluded by configuration: " << result.excluded_codes.size() << " flow(s)\n";
    }
    if (!result.skipped_codes.empty()) {
        os << "Skipped (unknown code):    " << result.skipped_codes.size() << " flow(s)\n";
    }
    os << rule << "\n";

    os.flags(saved_flags);
    os.precision(saved_precision);
}

} // namespace wbc
