#include <catch2/catch_test_macros.hpp>
#include "wbc/editor/config_editor.hpp"

using namespace wbc;

namespace {

FlowCatalog make_catalog() {
    return FlowCatalog({
        {"OUT_B", "Seepage", FlowCategory::Outflow, 200.0, "TSF"},
        {"IN_A", "Rainfall", FlowCategory::Inflow, 900.0, "TSF"},
        {"OUT_A", "Evaporation", FlowCategory::Outflow, 100.0, "TSF"},
        {"RC_A", "Dam loop", FlowCategory::Recirculation, 50.0, "TSF"},
    });
}

} // namespace

TEST_CASE("Editor lists flows grouped by category in catalog order", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store({{"OUT_A", false}});
    ConfigEditor editor(catalog, store);

    auto listing = editor.list_by_category();
    REQUIRE(listing.size() == 3);

    REQUIRE(listing[0].category == FlowCategory::Inflow);
    REQUIRE(listing[0].flows.size() == 1);
    REQUIRE(listing[0].flows[0].definition->code == "IN_A");

    REQUIRE(listing[1].category == FlowCategory::Recirculation);
    REQUIRE(listing[1].flows.size() == 1);

    REQUIRE(listing[2].category == FlowCategory::Outflow);
    REQUIRE(listing[2].flows.size() == 2);
    REQUIRE(listing[2].flows[0].definition->code == "OUT_B");
    REQUIRE(listing[2].flows[0].enabled);
    REQUIRE(listing[2].flows[1].definition->code == "OUT_A");
    REQUIRE_FALSE(listing[2].flows[1].enabled);
}

TEST_CASE("Toggle twice restores the original selection", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store({{"OUT_B", false}});
    ConfigEditor editor(catalog, store);

    const auto before = editor.enabled_codes();
    REQUIRE_FALSE(editor.is_dirty());

    editor.toggle("IN_A");
    REQUIRE_FALSE(editor.is_enabled("IN_A"));
    REQUIRE(editor.is_dirty());

    editor.toggle("IN_A");
    REQUIRE(editor.enabled_codes() == before);

    // No I/O until commit
    REQUIRE(store.save_count() == 0);
}

TEST_CASE("Toggling an unknown code is rejected", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store;
    ConfigEditor editor(catalog, store);

    REQUIRE_THROWS_AS(editor.toggle("REMOVED_FLOW"), std::invalid_argument);
    REQUIRE_THROWS_AS(editor.set_enabled("REMOVED_FLOW", false), std::invalid_argument);
    REQUIRE_THROWS_AS(editor.is_enabled("REMOVED_FLOW"), std::invalid_argument);
    REQUIRE_FALSE(editor.is_dirty());
}

TEST_CASE("Commit writes the full mapping and drops stale codes", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store({{"OUT_A", false}, {"GONE", false}});
    ConfigEditor editor(catalog, store);

    REQUIRE(editor.stale_codes() == std::vector<std::string>{"GONE"});

    editor.toggle("RC_A");
    REQUIRE(editor.commit());
    REQUIRE_FALSE(editor.is_dirty());
    REQUIRE(editor.stale_codes().empty());

    FlowConfig saved = store.load();
    REQUIRE(saved.size() == catalog.size());
    REQUIRE(saved.count("GONE") == 0);
    REQUIRE(saved.at("OUT_A") == false);
    REQUIRE(saved.at("RC_A") == false);
    REQUIRE(saved.at("IN_A") == true);
    REQUIRE(saved.at("OUT_B") == true);
}

TEST_CASE("Failed commit keeps edits pending", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store;
    ConfigEditor editor(catalog, store);

    editor.set_enabled("OUT_B", false);
    store.set_fail_saves(true);

    REQUIRE_FALSE(editor.commit());
    REQUIRE(editor.is_dirty());
    REQUIRE_FALSE(editor.is_enabled("OUT_B"));
    REQUIRE(store.load().empty());
}

TEST_CASE("Category-wide selection and reload", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store;
    ConfigEditor editor(catalog, store);

    editor.set_category_enabled(FlowCategory::Outflow, false);
    REQUIRE_FALSE(editor.is_enabled("OUT_A"));
    REQUIRE_FALSE(editor.is_enabled("OUT_B"));
    REQUIRE(editor.is_enabled("IN_A"));
    REQUIRE(editor.enabled_codes() == std::vector<std::string>{"IN_A", "RC_A"});

    editor.reload();
    REQUIRE_FALSE(editor.is_dirty());
    REQUIRE(editor.enabled_codes().size() == catalog.size());
}

TEST_CASE("Setting an unchanged state does not mark dirty", "[editor]") {
    FlowCatalog catalog = make_catalog();
    MemoryFlowConfigStore store;
    ConfigEditor editor(catalog, store);

    editor.set_enabled("IN_A", true);
    editor.set_category_enabled(FlowCategory::Inflow, true);
    REQUIRE_FALSE(editor.is_dirty());
}
