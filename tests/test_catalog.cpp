#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "wbc/core/catalog.hpp"
#include <filesystem>
#include <sstream>

using namespace wbc;
using Catch::Approx;

TEST_CASE("FlowCatalog preserves declaration order", "[catalog]") {
    FlowCatalog catalog({
        {"IN_B", "Borehole", FlowCategory::Inflow, 500.0, "NORTH"},
        {"OUT_A", "Evaporation", FlowCategory::Outflow, 120.0, "SOUTH"},
        {"IN_A", "Rainfall", FlowCategory::Inflow, 80.0, "NORTH"},
    });

    REQUIRE(catalog.size() == 3);
    REQUIRE(catalog.index_of("OUT_A") == 1);
    REQUIRE(catalog.index_of("MISSING") == -1);

    auto inflows = catalog.by_category(FlowCategory::Inflow);
    REQUIRE(inflows.size() == 2);
    REQUIRE(inflows[0]->code == "IN_B");
    REQUIRE(inflows[1]->code == "IN_A");

    REQUIRE(catalog.areas() == std::vector<std::string>{"NORTH", "SOUTH"});
    REQUIRE(catalog.area_index("SOUTH") == 1);

    const FlowDefinition* def = catalog.find("OUT_A");
    REQUIRE(def != nullptr);
    REQUIRE(def->category == FlowCategory::Outflow);
    REQUIRE(catalog.find("NOPE") == nullptr);
}

TEST_CASE("FlowCatalog rejects duplicate and empty codes", "[catalog]") {
    REQUIRE_THROWS_AS(FlowCatalog({
        {"A", "First", FlowCategory::Inflow, 1.0, "X"},
        {"A", "Again", FlowCategory::Outflow, 2.0, "X"},
    }), std::invalid_argument);

    REQUIRE_THROWS_AS(FlowCatalog({
        {"", "Nameless", FlowCategory::Inflow, 1.0, "X"},
    }), std::invalid_argument);
}

TEST_CASE("FlowCatalog nominal measurements", "[catalog]") {
    FlowCatalog catalog({
        {"A", "A", FlowCategory::Inflow, 100.0, "X"},
        {"B", "B", FlowCategory::Outflow, 40.0, "X"},
    });

    auto measured = catalog.nominal_measurements();
    REQUIRE(measured.size() == 2);
    REQUIRE(measured[1].code == "B");
    REQUIRE(measured[1].value == Approx(40.0));

    Vector volumes = catalog.nominal_volumes();
    REQUIRE(volumes.size() == 2);
    REQUIRE(volumes.sum() == Approx(140.0));
}

TEST_CASE("Catalog template parsing", "[catalog][io]") {
    std::istringstream template_text(R"(
# Site catalog
[inflows]
area: NDCD1-4
MERN_RAIN (Rainfall on decline) = 12 345 m3
MERN_GW = 1,250.5 m3   # no display name
this line is not a flow
area: UG2_NORTH
UG2N_BH (Borehole abstraction) = 150000 m3

[recirculation]
NDCD_LOOP (Dam loop) = 600 m3

[outflows]
area: OLD_TSF
OT_EVAP (TSF evaporation) = 28 900 m3
)");

    FlowCatalog catalog = FlowCatalog::parse(template_text);

    REQUIRE(catalog.size() == 5);

    const auto* rain = catalog.find("MERN_RAIN");
    REQUIRE(rain != nullptr);
    REQUIRE(rain->name == "Rainfall on decline");
    REQUIRE(rain->area == "NDCD1-4");
    REQUIRE(rain->category == FlowCategory::Inflow);
    REQUIRE(rain->nominal_volume == Approx(12345.0));

    const auto* gw = catalog.find("MERN_GW");
    REQUIRE(gw != nullptr);
    REQUIRE(gw->name == "MERN_GW");
    REQUIRE(gw->nominal_volume == Approx(1250.5));

    // Area resets at a new section
    const auto* loop = catalog.find("NDCD_LOOP");
    REQUIRE(loop != nullptr);
    REQUIRE(loop->category == FlowCategory::Recirculation);
    REQUIRE(loop->area == "UNKNOWN");

    REQUIRE(catalog.find("OT_EVAP")->area == "OLD_TSF");
    REQUIRE(catalog.areas().size() == 4);
}

TEST_CASE("Catalog template errors", "[catalog][io]") {
    SECTION("Flow before any section") {
        std::istringstream text("A (Alpha) = 10 m3\n");
        REQUIRE_THROWS_AS(FlowCatalog::parse(text), std::runtime_error);
    }

    SECTION("Unknown section") {
        std::istringstream text("[storage]\nA = 1 m3\n");
        REQUIRE_THROWS_AS(FlowCatalog::parse(text), std::runtime_error);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(FlowCatalog::from_file("/nonexistent/catalog.txt"),
                          std::runtime_error);
    }
}

TEST_CASE("Catalog template line parser", "[catalog][io]") {
    std::string code, name;
    Real value = 0.0;

    REQUIRE(catalog_io::parse_flow_line("X1 (Pump) = 4,200 m3", code, name, value));
    REQUIRE(code == "X1");
    REQUIRE(name == "Pump");
    REQUIRE(value == Approx(4200.0));

    REQUIRE_FALSE(catalog_io::parse_flow_line("X1 (Pump)", code, name, value));
    REQUIRE_FALSE(catalog_io::parse_flow_line("X1 = unknown", code, name, value));
    REQUIRE_FALSE(catalog_io::parse_flow_line(" = 12 m3", code, name, value));

    REQUIRE(catalog_io::parse_section("[outflows]") == FlowCategory::Outflow);
    REQUIRE_FALSE(catalog_io::parse_section("[dams]").has_value());
}

TEST_CASE("Catalog template written by to_file reloads", "[catalog][io]") {
    FlowCatalog catalog({
        {"IN_1", "Rain", FlowCategory::Inflow, 1500.0, "NORTH"},
        {"RC_1", "Loop", FlowCategory::Recirculation, 300.0, "NORTH"},
        {"OUT_1", "Seepage", FlowCategory::Outflow, 75.0, "SOUTH"},
    });

    auto path = std::filesystem::temp_directory_path() / "wbc_test_catalog.txt";
    catalog.to_file(path);
    FlowCatalog reloaded = FlowCatalog::from_file(path);
    std::filesystem::remove(path);

    REQUIRE(reloaded.size() == 3);
    REQUIRE(reloaded.find("OUT_1")->area == "SOUTH");
    REQUIRE(reloaded.find("RC_1")->category == FlowCategory::Recirculation);
    REQUIRE(reloaded.find("IN_1")->nominal_volume == Approx(1500.0));
}

TEST_CASE("Catalog template keeps large and fractional volumes", "[catalog][io]") {
    FlowCatalog catalog({
        {"BIG", "Decline dewatering", FlowCategory::Inflow, 2'345'678.0, "NDCD1-4"},
        {"FRAC", "Plant make-up", FlowCategory::Outflow, 123'456.7, "PLANT"},
        {"SMALL", "Sump", FlowCategory::Outflow, 0.25, "PLANT"},
    });

    auto path = std::filesystem::temp_directory_path() / "wbc_test_catalog_large.txt";
    catalog.to_file(path);
    FlowCatalog reloaded = FlowCatalog::from_file(path);
    std::filesystem::remove(path);

    REQUIRE(reloaded.size() == 3);
    REQUIRE(reloaded.find("BIG")->nominal_volume == 2'345'678.0);
    REQUIRE(reloaded.find("FRAC")->nominal_volume == 123'456.7);
    REQUIRE(reloaded.find("SMALL")->nominal_volume == 0.25);
}

TEST_CASE("Catalog template comments and value prefixes", "[catalog][io]") {
    std::istringstream template_text(
        "[inflows]\n"
        "BH3 (BH#3 abstraction) = ~12 345 m3  # estimated\n"
        "BH4#OLD = 500 m3\n");

    FlowCatalog catalog = FlowCatalog::parse(template_text);
    REQUIRE(catalog.size() == 2);

    const auto* bh3 = catalog.find("BH3");
    REQUIRE(bh3 != nullptr);
    REQUIRE(bh3->name == "BH#3 abstraction");
    REQUIRE(bh3->nominal_volume == Approx(12345.0));

    REQUIRE(catalog.contains("BH4#OLD"));

    std::string code, name;
    Real value = 0.0;
    REQUIRE(catalog_io::parse_flow_line("X2 = approx. 1,200 m3", code, name, value));
    REQUIRE(value == Approx(1200.0));
    REQUIRE(catalog_io::parse_flow_line("X3 = -40 m3", code, name, value));
    REQUIRE(value == Approx(-40.0));
}
