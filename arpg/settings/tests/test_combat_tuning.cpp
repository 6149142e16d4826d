#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arpg/settings/combat_tuning.hpp>
#include <nlohmann/json.hpp>

using namespace arpg::settings;
using Catch::Matchers::WithinAbs;

TEST_CASE("CombatTuning defaults", "[settings][tuning]") {
    CombatTuning tuning;

    REQUIRE_THAT(tuning.base_max_hp, WithinAbs(100.0f, 0.001f));
    REQUIRE_THAT(tuning.base_move_speed, WithinAbs(200.0f, 0.001f));
    REQUIRE_THAT(tuning.cooldown_reduction_cap, WithinAbs(0.4f, 0.0001f));
    REQUIRE_THAT(tuning.tile_size, WithinAbs(32.0f, 0.001f));
    REQUIRE_THAT(tuning.on_kill_window, WithinAbs(0.02, 1e-9));
    REQUIRE_THAT(tuning.event_window, WithinAbs(0.1, 1e-9));
}

TEST_CASE("CombatTuning validate clamps", "[settings][tuning]") {
    CombatTuning tuning;
    tuning.cooldown_reduction_cap = 3.0f;
    tuning.armor_constant = -5.0f;
    tuning.tile_size = 0.0f;
    tuning.event_window = -1.0;
    tuning.fixed_timestep = 0.0;
    tuning.validate();

    REQUIRE(tuning.cooldown_reduction_cap <= 0.95f);
    REQUIRE(tuning.armor_constant >= 1.0f);
    REQUIRE(tuning.tile_size >= 1.0f);
    REQUIRE(tuning.event_window == 0.0);
    REQUIRE(tuning.fixed_timestep > 0.0);
}

TEST_CASE("CombatTuning JSON", "[settings][tuning]") {
    SECTION("Partial object keeps defaults") {
        auto j = nlohmann::json::parse(R"({"tile_size": 16, "base_max_hp": 150})");
        CombatTuning tuning = combat_tuning_from_json(j);

        REQUIRE_THAT(tuning.tile_size, WithinAbs(16.0f, 0.001f));
        REQUIRE_THAT(tuning.base_max_hp, WithinAbs(150.0f, 0.001f));
        REQUIRE_THAT(tuning.base_move_speed, WithinAbs(200.0f, 0.001f));
    }

    SECTION("Round trip preserves values") {
        CombatTuning original;
        original.cooldown_reduction_cap = 0.3f;
        original.kill_history_seconds = 12.0;

        CombatTuning restored = combat_tuning_from_json(combat_tuning_to_json(original));
        REQUIRE(restored == original);
    }

    SECTION("Non-object falls back to defaults") {
        CombatTuning tuning = combat_tuning_from_json(nlohmann::json::array());
        REQUIRE(tuning == CombatTuning{});
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(load_combat_tuning("no/such/tuning.json").has_value());
    }
}
