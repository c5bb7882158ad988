#include <catch2/catch_test_macros.hpp>
#include "wbc/store/flow_config_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace wbc;
namespace fs = std::filesystem;

namespace {

/// Fresh directory under the system temp dir, removed on scope exit
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / ("wbc_test_" + name)) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::string read_file(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Missing flow config means everything enabled", "[store]") {
    TempDir dir("store_missing");
    FileFlowConfigStore store(dir.path / "balance_check_config.yaml");

    REQUIRE(store.load().empty());
}

TEST_CASE("Corrupt flow config falls back to empty mapping", "[store]") {
    TempDir dir("store_corrupt");
    const auto file = dir.path / "balance_check_config.yaml";

    SECTION("Invalid boolean") {
        std::ofstream(file) << "flows:\n  A:\n    enabled: maybe\n";
    }
    SECTION("Entries without a flows section") {
        std::ofstream(file) << "  A:\n    enabled: false\n";
    }
    SECTION("Line without key") {
        std::ofstream(file) << "flows:\n  A disabled\n";
    }
    SECTION("Scalar where a code block is expected") {
        std::ofstream(file) << "flows:\n  A: false\n";
    }

    FileFlowConfigStore store(file);
    REQUIRE_NOTHROW(store.load());
    REQUIRE(store.load().empty());
}

TEST_CASE("Flow config save then load", "[store]") {
    TempDir dir("store_roundtrip");
    const auto file = dir.path / "nested" / "balance_check_config.yaml";
    FileFlowConfigStore store(file);

    FlowConfig config{{"MERN_RAIN", true}, {"OT_EVAP", false}};
    REQUIRE(store.save(config));
    REQUIRE(fs::exists(file));
    REQUIRE_FALSE(fs::exists(file.string() + ".tmp"));

    FlowConfig loaded = store.load();
    REQUIRE(loaded == config);

    // Output is sorted by code
    const std::string text = read_file(file);
    REQUIRE(text.find("MERN_RAIN") < text.find("OT_EVAP"));
}

TEST_CASE("Failed save leaves previous file in place", "[store]") {
    TempDir dir("store_atomic");
    const auto file = dir.path / "balance_check_config.yaml";
    FileFlowConfigStore store(file);

    REQUIRE(store.save({{"A", false}}));
    const std::string before = read_file(file);

    // Block the temporary file location
    fs::create_directories(file.string() + ".tmp");

    REQUIRE_FALSE(store.save({{"A", true}, {"B", false}}));
    REQUIRE(read_file(file) == before);
    REQUIRE(store.load() == FlowConfig{{"A", false}});
    REQUIRE(fs::is_directory(file.string() + ".tmp"));
}

TEST_CASE("Flow config parser accepts comments and extra fields", "[store][io]") {
    std::istringstream text(R"(
# exported by the desktop app
version: 2
flows:
  MERN_RAIN:
    name: Rainfall on decline
    enabled: yes
  OT_EVAP:   # TSF evaporation
    area: OLD_TSF
    enabled: false
  NO_FLAG:
    name: entry without flag
)");

    auto parsed = flow_config_io::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 2);
    REQUIRE(parsed->at("MERN_RAIN") == true);
    REQUIRE(parsed->at("OT_EVAP") == false);
    REQUIRE(parsed->count("NO_FLAG") == 0);
}

TEST_CASE("MemoryFlowConfigStore", "[store]") {
    MemoryFlowConfigStore store({{"A", false}});
    REQUIRE(store.load().at("A") == false);

    REQUIRE(store.save({{"A", true}}));
    REQUIRE(store.save_count() == 1);
    REQUIRE(store.load().at("A") == true);

    store.set_fail_saves(true);
    REQUIRE_FALSE(store.save({{"A", false}}));
    REQUIRE(store.load().at("A") == true);
}
