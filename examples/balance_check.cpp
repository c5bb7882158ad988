/**
 * @file balance_check.cpp
 * @brief Example: command-line water balance check
 *
 * Demonstrates:
 * - Session setup from a config file
 * - Listing and changing the flow selection
 * - Balance calculation from measured or nominal volumes
 *
 * Usage:
 *   balance_check <config> [measurements.csv] [--list]
 *                 [--disable CODE]... [--enable CODE]... [--storage M3]
 */

#include <wbc/wbc.hpp>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace wbc;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <config> [measurements.csv] [--list]"
              << " [--disable CODE]... [--enable CODE]... [--storage M3]\n";
}

void print_listing(ConfigEditor& editor) {
    for (const auto& group : editor.list_by_category()) {
        std::cout << config_io::to_string(group.category) << " ("
                  << group.flows.size() << ")\n";
        for (const auto& sel : group.flows) {
            std::cout << "  [" << (sel.enabled ? 'x' : ' ') << "] "
                      << sel.definition->code << "  " << sel.definition->name
                      << "  " << format_volume(sel.definition->nominal_volume) << "\n";
        }
    }
    for (const auto& code : editor.stale_codes()) {
        std::cout << "  stale config entry (not in catalog): " << code << "\n";
    }
}

/// Parse a whole argument as a number; trailing text is an error
bool parse_real(const char* text, Real& value) {
    char* end = nullptr;
    errno = 0;
    value = std::strtod(text, &end);
    return end != text && *end == '\0' && errno == 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string measurements;
    std::vector<std::pair<std::string, bool>> changes;
    bool list = false;
    Real storage_change = 0.0;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--list") {
            list = true;
        } else if ((arg == "--disable" || arg == "--enable") && i + 1 < argc) {
            changes.emplace_back(argv[++i], arg == "--enable");
        } else if (arg == "--storage" && i + 1 < argc) {
            if (!parse_real(argv[++i], storage_change)) {
                std::cerr << "Invalid storage change: " << argv[i] << "\n";
                return 1;
            }
        } else if (measurements.empty() && arg.rfind("--", 0) != 0) {
            measurements = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        auto check = BalanceCheck::from_config(std::string(argv[1]));

        if (!changes.empty()) {
            auto& editor = check.editor();
            for (const auto& [code, enabled] : changes) {
                editor.set_enabled(code, enabled);
            }
            if (!editor.commit()) {
                std::cerr << "Could not save flow configuration to "
                          << check.store().describe() << "\n";
                return 1;
            }
            std::cout << "Saved flow configuration to " << check.store().describe() << "\n";
        }

        if (list) {
            print_listing(check.editor());
            return 0;
        }

        if (measurements.empty() && !check.config().measurements_file.empty()) {
            measurements = check.config().measurements_file.string();
        }

        BalanceResult result = measurements.empty()
            ? check.calculate_nominal(storage_change)
            : check.calculate_file(measurements, storage_change);

        print_summary(result, std::cout);
        for (const auto& code : result.skipped_codes) {
            std::cout << "  unknown flow code: " << code << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
