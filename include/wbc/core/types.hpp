/**
 * @file types.hpp
 * @brief Core type definitions for wbc
 *
 * This file defines the fundamental types used throughout wbc,
 * including scalar types, array types, and the flow category enums.
 */

#pragma once

#include <Eigen/Core>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wbc {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using MatrixI = Eigen::Matrix<Index, Eigen::Dynamic, Eigen::Dynamic>;

// ============================================================================
// Flow Enums
// ============================================================================

/**
 * @brief Direction of a flow relative to the site water system
 */
enum class FlowCategory {
    Inflow,             ///< Water entering the system (rain, abstraction, ...)
    Recirculation,      ///< Water pumped back within the system (dam loops)
    Outflow,            ///< Water leaving the system (evaporation, seepage, ...)
};

/// Number of flow categories, used as column count for totals matrices
constexpr Index N_CATEGORIES = 3;

/// All categories in reporting order
constexpr std::array<FlowCategory, N_CATEGORIES> ALL_CATEGORIES = {
    FlowCategory::Inflow,
    FlowCategory::Recirculation,
    FlowCategory::Outflow,
};

/// Column index of a category in totals matrices
constexpr Index category_index(FlowCategory category) {
    switch (category) {
        case FlowCategory::Inflow: return 0;
        case FlowCategory::Recirculation: return 1;
        case FlowCategory::Outflow: return 2;
    }
    return 0;
}

/**
 * @brief Quality classification of a balance error
 */
enum class BalanceStatus {
    Excellent,          ///< |error| below the excellent threshold
    Good,               ///< |error| below the good threshold
    Check,              ///< Imbalance large enough to warrant a data check
    Undefined,          ///< No inflow, error percentage is N/A
};

// ============================================================================
// Flow Records
// ============================================================================

/**
 * @brief One catalog entry describing a known flow
 */
struct FlowDefinition {
    std::string code;               ///< Stable unique identifier
    std::string name;               ///< Display name
    FlowCategory category = FlowCategory::Inflow;
    Real nominal_volume = 0.0;      ///< Template volume [m³]
    std::string area = "UNKNOWN";   ///< Site area the flow belongs to
};

/**
 * @brief A measured volume for one flow code, supplied per calculation
 */
struct MeasuredFlow {
    std::string code;
    Real value = 0.0;               ///< [m³]
};

using MeasuredFlows = std::vector<MeasuredFlow>;

/// Persisted enable flags: flow code → enabled. Absent codes are enabled.
using FlowConfig = std::unordered_map<std::string, bool>;

// ============================================================================
// Forward Declarations
// ============================================================================

class FlowCatalog;
class FlowConfigStore;
class ConfigEditor;
class BalanceEngine;
class Config;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real EXCELLENT_THRESHOLD = 0.1;   ///< % error for Excellent
    constexpr Real GOOD_THRESHOLD = 0.5;        ///< % error for Good
    constexpr Real EPSILON = 1e-15;             ///< Numerical zero
}

} // namespace wbc
