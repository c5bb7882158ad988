/**
 * @file bindings.cpp
 * @brief Python bindings for wbc using pybind11
 *
 * Provides Python interface for:
 * - Catalog loading and lookup
 * - Flow selection (editor) and persistence
 * - Balance calculation and reporting
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "wbc/wbc.hpp"
#include <sstream>

namespace py = pybind11;
using namespace wbc;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert (code, value) pairs from Python into measurements
MeasuredFlows to_measured(const std::vector<std::pair<std::string, double>>& pairs) {
    MeasuredFlows flows;
    flows.reserve(pairs.size());
    for (const auto& [code, value] : pairs) {
        flows.push_back({code, value});
    }
    return flows;
}

/// Listing as [(category, [(definition, enabled), ...]), ...]
py::list listing_to_python(const std::vector<CategoryListing>& listing) {
    py::list out;
    for (const auto& group : listing) {
        py::list flows;
        for (const auto& sel : group.flows) {
            flows.append(py::make_tuple(*sel.definition, sel.enabled));
        }
        out.append(py::make_tuple(group.category, flows));
    }
    return out;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(wbc_py, m) {
    m.doc() = R"pbdoc(
        wbc: Water Balance Check core
        =============================

        Configurable flow filtering and balance aggregation for the
        water balance desktop application.

        Example:
            >>> import wbc_py as wbc
            >>> check = wbc.BalanceCheck.from_config("wbc.yaml")
            >>> check.editor().toggle("OT_EVAP")
            >>> check.editor().commit()
            >>> result = check.calculate([("MERN_RAIN", 1200.0)])
            >>> result.error_percent
    )pbdoc";

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<FlowCategory>(m, "FlowCategory")
        .value("Inflow", FlowCategory::Inflow)
        .value("Recirculation", FlowCategory::Recirculation)
        .value("Outflow", FlowCategory::Outflow)
        .export_values();

    py::enum_<BalanceStatus>(m, "BalanceStatus")
        .value("Excellent", BalanceStatus::Excellent)
        .value("Good", BalanceStatus::Good)
        .value("Check", BalanceStatus::Check)
        .value("Undefined", BalanceStatus::Undefined)
        .export_values();

    // ========================================================================
    // Catalog
    // ========================================================================

    py::class_<FlowDefinition>(m, "FlowDefinition")
        .def(py::init<>())
        .def_readwrite("code", &FlowDefinition::code)
        .def_readwrite("name", &FlowDefinition::name)
        .def_readwrite("category", &FlowDefinition::category)
        .def_readwrite("nominal_volume", &FlowDefinition::nominal_volume)
        .def_readwrite("area", &FlowDefinition::area)
        .def("__repr__", [](const FlowDefinition& d) {
            return "<FlowDefinition " + d.code + " (" + config_io::to_string(d.category) + ")>";
        });

    py::class_<FlowCatalog, Ptr<FlowCatalog>>(m, "FlowCatalog")
        .def(py::init<std::vector<FlowDefinition>>())
        .def_static("from_file", [](const std::string& path, bool verbose) {
            return FlowCatalog::from_file(path, verbose);
        }, py::arg("path"), py::arg("verbose") = false)
        .def("to_file", [](const FlowCatalog& c, const std::string& path) { c.to_file(path); })
        .def("contains", &FlowCatalog::contains)
        .def("definitions", &FlowCatalog::definitions)
        .def("areas", &FlowCatalog::areas)
        .def("nominal_volumes", &FlowCatalog::nominal_volumes)
        .def("by_category", [](const FlowCatalog& c, FlowCategory category) {
            std::vector<FlowDefinition> out;
            for (const auto* def : c.by_category(category)) out.push_back(*def);
            return out;
        })
        .def("__len__", &FlowCatalog::size);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<BalanceConfig>(m, "BalanceConfig")
        .def(py::init<>())
        .def_readwrite("excellent_threshold", &BalanceConfig::excellent_threshold)
        .def_readwrite("good_threshold", &BalanceConfig::good_threshold)
        .def_readwrite("verbose", &BalanceConfig::verbose)
        .def("classify", &BalanceConfig::classify)
        .def("validate", &BalanceConfig::validate);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", [](const std::string& path) { return Config::from_file(path); })
        .def("to_file", [](const Config& c, const std::string& path) { c.to_file(path); })
        .def("validate", &Config::validate)
        .def_readwrite("balance", &Config::balance)
        .def_property("catalog_file",
            [](const Config& c) { return c.catalog_file.string(); },
            [](Config& c, const std::string& p) { c.catalog_file = p; })
        .def_property("flow_config_file",
            [](const Config& c) { return c.flow_config_file.string(); },
            [](Config& c, const std::string& p) { c.flow_config_file = p; });

    // ========================================================================
    // Editor
    // ========================================================================

    py::class_<ConfigEditor>(m, "ConfigEditor")
        .def("list_by_category", [](const ConfigEditor& e) {
            return listing_to_python(e.list_by_category());
        })
        .def("toggle", &ConfigEditor::toggle)
        .def("set_enabled", &ConfigEditor::set_enabled)
        .def("set_category_enabled", &ConfigEditor::set_category_enabled)
        .def("is_enabled", &ConfigEditor::is_enabled)
        .def("enabled_codes", &ConfigEditor::enabled_codes)
        .def("stale_codes", &ConfigEditor::stale_codes)
        .def("is_dirty", &ConfigEditor::is_dirty)
        .def("current", &ConfigEditor::current)
        .def("commit", &ConfigEditor::commit)
        .def("reload", &ConfigEditor::reload);

    // ========================================================================
    // Result Types
    // ========================================================================

    py::class_<BalanceTotals>(m, "BalanceTotals")
        .def_readonly("total_inflow", &BalanceTotals::total_inflow)
        .def_readonly("total_outflow", &BalanceTotals::total_outflow)
        .def_readonly("total_recirculation", &BalanceTotals::total_recirculation)
        .def_readonly("storage_change", &BalanceTotals::storage_change)
        .def_readonly("inflow_count", &BalanceTotals::inflow_count)
        .def_readonly("outflow_count", &BalanceTotals::outflow_count)
        .def_readonly("recirculation_count", &BalanceTotals::recirculation_count)
        .def_readonly("delta", &BalanceTotals::delta)
        .def_readonly("error_percent", &BalanceTotals::error_percent)
        .def_readonly("status", &BalanceTotals::status)
        .def("is_balanced", &BalanceTotals::is_balanced);

    py::class_<AreaBalance, BalanceTotals>(m, "AreaBalance")
        .def_readonly("area", &AreaBalance::area);

    py::class_<BalanceResult, BalanceTotals>(m, "BalanceResult")
        .def_readonly("areas", &BalanceResult::areas)
        .def_readonly("skipped_codes", &BalanceResult::skipped_codes)
        .def_readonly("excluded_codes", &BalanceResult::excluded_codes)
        .def("summary", [](const BalanceResult& r) {
            std::ostringstream ss;
            print_summary(r, ss);
            return ss.str();
        })
        .def("__repr__", [](const BalanceResult& r) {
            return "<BalanceResult delta=" + std::to_string(r.delta) +
                   " status=" + config_io::to_string(r.status) + ">";
        });

    // ========================================================================
    // Session
    // ========================================================================

    py::class_<BalanceCheck>(m, "BalanceCheck")
        .def(py::init([](const FlowCatalog& catalog, const std::string& flow_config_file,
                         const BalanceConfig& settings) {
            return std::make_unique<BalanceCheck>(
                catalog,
                std::make_unique<FileFlowConfigStore>(flow_config_file, settings.verbose),
                settings);
        }), py::arg("catalog"), py::arg("flow_config_file"),
            py::arg("settings") = BalanceConfig{})
        .def_static("from_config",
            py::overload_cast<const std::string&>(&BalanceCheck::from_config))
        .def("calculate", [](BalanceCheck& c,
                             const std::vector<std::pair<std::string, double>>& measured,
                             double storage_change) {
            return c.calculate(to_measured(measured), storage_change);
        }, py::arg("measured"), py::arg("storage_change") = 0.0)
        .def("calculate_nominal", &BalanceCheck::calculate_nominal,
             py::arg("storage_change") = 0.0)
        .def("calculate_file", [](BalanceCheck& c, const std::string& path, double storage_change) {
            return c.calculate_file(path, storage_change);
        }, py::arg("path"), py::arg("storage_change") = 0.0)
        .def("refresh", &BalanceCheck::refresh)
        .def("editor", &BalanceCheck::editor, py::return_value_policy::reference_internal)
        .def("catalog", &BalanceCheck::catalog, py::return_value_policy::reference_internal);

    // ========================================================================
    // Helpers
    // ========================================================================

    m.def("format_volume", &format_volume, "Compact volume label (1.23M, 45.6K, 789)");

    m.attr("__version__") = "0.1.0";
}
