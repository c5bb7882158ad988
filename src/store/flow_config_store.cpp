/**
 * @file flow_config_store.cpp
 * @brief File and in-memory flow configuration stores
 */

#include "wbc/store/flow_config_store.hpp"
#include "wbc/core/config.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

namespace wbc {

namespace {

/**
 * @brief Temporary sibling file that is removed unless committed
 */
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::filesystem::path& target)
        : target_(target), temp_(target) {
        temp_ += ".tmp";
        stream_.open(temp_, std::ios::out | std::ios::trunc);
        opened_ = stream_.is_open();
    }

    ~ScopedTempFile() {
        if (stream_.is_open()) stream_.close();
        if (opened_ && !committed_) {
            std::error_code ec;
            std::filesystem::remove(temp_, ec);
        }
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    bool is_open() const { return stream_.is_open(); }
    std::ofstream& stream() { return stream_; }

    /// Flush, close and rename over the target
    bool commit(std::error_code& ec) {
        stream_.flush();
        const bool written = static_cast<bool>(stream_);
        stream_.close();
        if (!written || stream_.fail()) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        std::filesystem::rename(temp_, target_, ec);
        if (ec) return false;
        committed_ = true;
        return true;
    }

private:
    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::ofstream stream_;
    bool opened_ = false;
    bool committed_ = false;
};

} // namespace

// ============================================================================
// FileFlowConfigStore
// ============================================================================

FileFlowConfigStore::FileFlowConfigStore(std::filesystem::path filepath, bool verbose)
    : filepath_(std::move(filepath)), verbose_(verbose) {}

FlowConfig FileFlowConfigStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(filepath_, ec)) {
        if (verbose_) {
            std::cerr << "Flow config " << filepath_ << " not found, all flows enabled\n";
        }
        return {};
    }

    std::ifstream file(filepath_);
    if (!file.is_open()) {
        if (verbose_) {
            std::cerr << "Cannot open flow config " << filepath_ << ", all flows enabled\n";
        }
        return {};
    }

    auto parsed = flow_config_io::parse(file);
    if (!parsed) {
        if (verbose_) {
            std::cerr << "Flow config " << filepath_ << " is corrupt, all flows enabled\n";
        }
        return {};
    }
    return *parsed;
}

bool FileFlowConfigStore::save(const FlowConfig& config) {
    std::error_code ec;
    if (filepath_.has_parent_path()) {
        std::filesystem::create_directories(filepath_.parent_path(), ec);
        if (ec) {
            if (verbose_) {
                std::cerr << "Cannot create directory for " << filepath_ << ": "
                          << ec.message() << "\n";
            }
            return false;
        }
    }

    ScopedTempFile temp(filepath_);
    if (!temp.is_open()) {
        if (verbose_) {
            std::cerr << "Cannot write flow config " << filepath_ << "\n";
        }
        return false;
    }

    flow_config_io::write(temp.stream(), config);

    if (!temp.commit(ec)) {
        if (verbose_) {
            std::cerr << "Saving flow config " << filepath_ << " failed: "
                      << ec.message() << "\n";
        }
        return false;
    }
    return true;
}

// ============================================================================
// MemoryFlowConfigStore
// ============================================================================

bool MemoryFlowConfigStore::save(const FlowConfig& config) {
    if (fail_saves_) return false;
    config_ = config;
    ++save_count_;
    return true;
}

// ============================================================================
// flow_config_io
// ============================================================================

namespace flow_config_io {

std::optional<FlowConfig> parse(std::istream& is) {
    FlowConfig config;

    std::string section;
    bool in_section = false;
    std::string current_code;
    int code_indent = -1;

    for (const auto& kv : config_io::tokenize(is)) {
        if (kv.key.empty()) return std::nullopt;

        if (kv.indent == 0) {
            // Top-level scalars are metadata; top-level headers open a section
            section = kv.value.empty() ? kv.key : std::string();
            in_section = kv.value.empty();
            current_code.clear();
            code_indent = -1;
            continue;
        }

        if (!in_section) return std::nullopt;
        if (section != "flows") continue;

        if (!current_code.empty() && kv.indent > code_indent) {
            if (kv.key == "enabled") {
                auto enabled = config_io::parse_bool(kv.value);
                if (!enabled) return std::nullopt;
                config[current_code] = *enabled;
            }
            // Other per-flow fields (name, area) are informational
            continue;
        }

        if (!kv.value.empty()) return std::nullopt;

        current_code = kv.key;
        code_indent = kv.indent;
    }

    return config;
}

void write(std::ostream& os, const FlowConfig& config) {
    std::vector<std::string> codes;
    codes.reserve(config.size());
    for (const auto& [code, enabled] : config) {
        codes.push_back(code);
    }
    std::sort(codes.begin(), codes.end());

    os << "# wbc Balance Check Flow Configuration\n";
    os << "# Flows not listed here are included in the balance.\n\n";
    os << "flows:\n";
    for (const auto& code : codes) {
        os << "  " << code << ":\n";
        os << "    enabled: " << (config.at(code) ? "true" : "false") << "\n";
    }
}

} // namespace flow_config_io

} // namespace wbc
