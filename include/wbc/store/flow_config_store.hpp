/**
 * @file flow_config_store.hpp
 * @brief Persistence of per-flow enable flags
 *
 * The store maps flow code → enabled. An empty mapping means every flow
 * is enabled, which is also what callers get when the backing file is
 * missing or corrupt.
 */

#pragma once

#include "../core/types.hpp"
#include <filesystem>
#include <iosfwd>

namespace wbc {

/**
 * @brief Abstract flow configuration store
 *
 * Passed by reference into the editor and the balance check so tests
 * can inject an in-memory store.
 */
class FlowConfigStore {
public:
    virtual ~FlowConfigStore() = default;

    /**
     * @brief Load the enable flags
     *
     * Never throws for missing or unreadable data; returns an empty
     * mapping instead.
     */
    virtual FlowConfig load() const = 0;

    /**
     * @brief Replace the stored flags
     *
     * @return false if nothing was written; the previous contents stay
     */
    virtual bool save(const FlowConfig& config) = 0;

    /// Short description for diagnostics
    virtual std::string describe() const = 0;
};

/**
 * @brief Store backed by a key-value file
 *
 * @code
 * flows:
 *   MERN_RAIN:
 *     enabled: true
 * @endcode
 *
 * save() writes `<file>.tmp` and renames it over the target, so a
 * partial write never replaces the previous file.
 */
class FileFlowConfigStore : public FlowConfigStore {
public:
    explicit FileFlowConfigStore(std::filesystem::path filepath, bool verbose = false);

    FlowConfig load() const override;
    bool save(const FlowConfig& config) override;
    std::string describe() const override { return filepath_.string(); }

    const std::filesystem::path& path() const { return filepath_; }

private:
    std::filesystem::path filepath_;
    bool verbose_;
};

/**
 * @brief Store held in memory
 */
class MemoryFlowConfigStore : public FlowConfigStore {
public:
    MemoryFlowConfigStore() = default;
    explicit MemoryFlowConfigStore(FlowConfig initial) : config_(std::move(initial)) {}

    FlowConfig load() const override { return config_; }
    bool save(const FlowConfig& config) override;
    std::string describe() const override { return "<memory>"; }

    /// Make subsequent saves fail (to exercise error paths)
    void set_fail_saves(bool fail) { fail_saves_ = fail; }

    Index save_count() const { return save_count_; }

private:
    FlowConfig config_;
    bool fail_saves_ = false;
    Index save_count_ = 0;
};

namespace flow_config_io {

/**
 * @brief Parse the flow configuration format
 *
 * @return nullopt if the document is malformed
 */
std::optional<FlowConfig> parse(std::istream& is);

/// Write the flow configuration format, codes sorted
void write(std::ostream& os, const FlowConfig& config);

} // namespace flow_config_io

} // namespace wbc
