#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arpg/affix/affix_catalog.hpp>
#include <arpg/affix/conditional_routing.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <limits>

using namespace arpg::affix;
using arpg::items::AffixCategory;
using Catch::Matchers::WithinAbs;

TEST_CASE("Built-in affix catalog", "[affix][catalog]") {
    const AffixCatalog& catalog = builtin_affix_catalog();

    SECTION("Contains regular and conditional content") {
        REQUIRE(catalog.size() == 37);
        REQUIRE(catalog.get_by_category(AffixCategory::Conditional).size() == 24);
        REQUIRE(catalog.get_by_category(AffixCategory::Offensive).size() == 5);
        REQUIRE(catalog.get_by_category(AffixCategory::Defensive).size() == 4);
        REQUIRE(catalog.get_by_category(AffixCategory::Utility).size() == 4);

        auto ids = catalog.get_all_ids();
        REQUIRE(ids.size() == 37);
        REQUIRE(std::is_sorted(ids.begin(), ids.end()));
        REQUIRE(std::find(ids.begin(), ids.end(), "cond_kill_streak_speed") != ids.end());
    }

    SECTION("Every conditional has a condition and a route") {
        for (const AffixDefinition* def : catalog.get_by_category(AffixCategory::Conditional)) {
            INFO(def->id);
            REQUIRE(def->condition.has_value());
            REQUIRE(params_match_condition(def->condition->type, def->condition->params));
            REQUIRE(find_conditional_route(def->stat_key).has_value());
        }
    }

    SECTION("Every regular affix names a passive channel") {
        catalog.each([](const AffixDefinition& def) {
            if (!def.is_conditional()) {
                INFO(def.id);
                REQUIRE(find_passive_channel(def.stat_key).has_value());
            }
        });
    }

    SECTION("Kill streak speed definition") {
        const AffixDefinition* def = catalog.get("cond_kill_streak_speed");
        REQUIRE(def != nullptr);
        REQUIRE(def->stat_key == "condKillStreakSpeed");
        REQUIRE(def->condition->type == ConditionType::KillStreak);
        auto params = std::get<KillStreakParams>(def->condition->params);
        REQUIRE(params.kills_required == 3);
        REQUIRE_THAT(params.window_seconds, WithinAbs(4.0, 0.001));
        REQUIRE_THAT(def->min_value, WithinAbs(15.0f, 0.001f));
        REQUIRE_THAT(def->max_value, WithinAbs(25.0f, 0.001f));
        REQUIRE_THAT(def->buff_duration, WithinAbs(5.0, 0.001));
        REQUIRE(def->is_timed());
    }

    SECTION("Lookup by stat key") {
        const AffixDefinition* def = catalog.find_by_stat("condHitSlowedAtkSpd");
        REQUIRE(def != nullptr);
        REQUIRE(def->id == "cond_hit_slowed_speed");
        auto params = std::get<StatusOnTargetParams>(def->condition->params);
        REQUIRE(params.statuses.size() == 2);

        REQUIRE(catalog.find_by_stat("condTypoKey") == nullptr);
        REQUIRE(catalog.get("no_such_affix") == nullptr);
    }
}

TEST_CASE("AffixCatalog registration validation", "[affix][catalog]") {
    AffixCatalog catalog;

    AffixDefinition def;
    def.id = "cond_test";
    def.stat_key = "condMovingDamage";
    def.category = AffixCategory::Conditional;
    def.min_value = 5.0f;
    def.max_value = 10.0f;
    def.condition = make_condition(ConditionType::WhileMoving);

    SECTION("Valid definition registers") {
        REQUIRE(catalog.register_definition(def));
        REQUIRE(catalog.contains("cond_test"));
        REQUIRE(catalog.find_by_stat("condMovingDamage")->id == "cond_test");
    }

    SECTION("Conditional without a route is rejected") {
        def.stat_key = "condUnroutedKey";
        std::string error;
        REQUIRE_FALSE(catalog.register_definition(def, &error));
        REQUIRE_FALSE(error.empty());
        REQUIRE(catalog.empty());
    }

    SECTION("Conditional without a condition is rejected") {
        def.condition.reset();
        REQUIRE_FALSE(catalog.register_definition(def));
    }

    SECTION("Mismatched parameters are rejected") {
        def.condition = Condition{ConditionType::KillStreak, MultiHitParams{}};
        REQUIRE_FALSE(catalog.register_definition(def));
    }

    SECTION("Non-finite range is rejected") {
        def.max_value = std::numeric_limits<float>::infinity();
        REQUIRE_FALSE(catalog.register_definition(def));
    }

    SECTION("Inverted range is swapped") {
        def.min_value = 10.0f;
        def.max_value = 5.0f;
        REQUIRE(catalog.register_definition(def));
        REQUIRE_THAT(catalog.get("cond_test")->min_value, WithinAbs(5.0f, 0.001f));
        REQUIRE_THAT(catalog.get("cond_test")->max_value, WithinAbs(10.0f, 0.001f));
    }

    SECTION("Second id on a taken stat key is rejected") {
        REQUIRE(catalog.register_definition(def));

        AffixDefinition other = def;
        other.id = "cond_other";
        std::string error;
        REQUIRE_FALSE(catalog.register_definition(other, &error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(catalog.contains("cond_other"));
        REQUIRE(catalog.find_by_stat("condMovingDamage")->id == "cond_test");
    }

    SECTION("Re-keying an id keeps the stat index consistent") {
        REQUIRE(catalog.register_definition(def));

        AffixDefinition rekeyed = def;
        rekeyed.stat_key = "condStationaryDamage";
        rekeyed.condition = make_condition(ConditionType::WhileStationary);
        REQUIRE(catalog.register_definition(rekeyed));
        REQUIRE(catalog.find_by_stat("condMovingDamage") == nullptr);
        REQUIRE(catalog.find_by_stat("condStationaryDamage")->id == "cond_test");

        // The freed key can now be claimed by another id
        AffixDefinition other = def;
        other.id = "cond_other";
        REQUIRE(catalog.register_definition(other));
        REQUIRE(catalog.find_by_stat("condMovingDamage")->id == "cond_other");

        // Re-registering the first id with its current key leaves the other mapping alone
        REQUIRE(catalog.register_definition(rekeyed));
        REQUIRE(catalog.find_by_stat("condMovingDamage")->id == "cond_other");
        REQUIRE(catalog.find_by_stat("condStationaryDamage")->id == "cond_test");
        REQUIRE(catalog.size() == 2);
    }

    SECTION("Regular affix must name a channel") {
        AffixDefinition regular;
        regular.id = "bad";
        regular.stat_key = "flatDmg";
        regular.category = AffixCategory::Offensive;
        REQUIRE_FALSE(catalog.register_definition(regular));

        regular.stat_key = "flatDamage";
        REQUIRE(catalog.register_definition(regular));
    }
}

TEST_CASE("AffixCatalog JSON loading", "[affix][catalog][json]") {
    AffixCatalog catalog;

    SECTION("Parses definitions with condition parameters") {
        auto j = nlohmann::json::parse(R"({
            "affixes": [
                {
                    "id": "cond_stationary_damage",
                    "stat": "condStationaryDamage",
                    "category": "conditional",
                    "min_value": 12,
                    "max_value": 20,
                    "weight": 20,
                    "condition": { "type": "while-stationary", "minStationaryMs": 750 }
                },
                {
                    "id": "cond_hit_slowed_speed",
                    "stat": "condHitSlowedAtkSpd",
                    "category": "conditional",
                    "min_value": 8,
                    "max_value": 16,
                    "condition": { "type": "status-on-target", "statusEffect": "slow,chill" }
                },
                {
                    "id": "cond_high_focus_cdr",
                    "stat": "condHighFocusCDR",
                    "category": "conditional",
                    "min_value": 5,
                    "max_value": 10,
                    "condition": { "type": "stat-breakpoint", "stat": "focus", "threshold": 15 }
                },
                {
                    "id": "flat_hp",
                    "stat": "flatHP",
                    "category": "defensive",
                    "min_value": 10,
                    "max_value": 50
                }
            ]
        })");

        auto result = catalog.load_from_json(j);
        REQUIRE(result.success());
        REQUIRE(result.loaded_count() == 4);
        REQUIRE(catalog.size() == 4);

        auto stationary = std::get<StationaryParams>(catalog.get("cond_stationary_damage")->condition->params);
        REQUIRE_THAT(stationary.min_stationary_ms, WithinAbs(750.0f, 0.001f));

        auto slowed = std::get<StatusOnTargetParams>(catalog.get("cond_hit_slowed_speed")->condition->params);
        REQUIRE(slowed.statuses == std::vector<StatusType>{StatusType::Slow, StatusType::Chill});

        auto focus = std::get<StatBreakpointParams>(catalog.get("cond_high_focus_cdr")->condition->params);
        REQUIRE(focus.stat == Attribute::Focus);
        REQUIRE_THAT(focus.threshold, WithinAbs(15.0f, 0.001f));
    }

    SECTION("Missing parameters fall back to defaults") {
        auto j = nlohmann::json::parse(R"([
            { "id": "far", "stat": "condFarRangeProjSpeed", "category": "conditional",
              "min_value": 15, "max_value": 30, "condition": { "type": "distance-far" } }
        ])");

        auto result = catalog.load_from_json(j);
        REQUIRE(result.success());
        auto params = std::get<DistanceParams>(catalog.get("far")->condition->params);
        REQUIRE_THAT(params.tile_radius, WithinAbs(5.0f, 0.001f));
    }

    SECTION("Stat breakpoint requires a threshold") {
        auto j = nlohmann::json::parse(R"([
            { "id": "focus_cdr", "stat": "condHighFocusCDR", "category": "conditional", "min_value": 5,
              "condition": { "type": "stat-breakpoint", "stat": "focus" } }
        ])");

        auto result = catalog.load_from_json(j);
        REQUIRE_FALSE(result.success());
        REQUIRE(result.error_count() == 1);
        REQUIRE(result.errors[0].find("threshold") != std::string::npos);
        REQUIRE_FALSE(catalog.contains("focus_cdr"));
    }

    SECTION("Status list may be given as an array") {
        auto j = nlohmann::json::parse(R"([
            { "id": "burning", "stat": "condHitBurningDamage", "category": "conditional", "min_value": 10,
              "condition": { "type": "status-on-target", "statusEffect": ["burn"] } }
        ])");

        auto result = catalog.load_from_json(j);
        REQUIRE(result.success());
        const auto& params = std::get<StatusOnTargetParams>(catalog.get("burning")->condition->params);
        REQUIRE(params.statuses.size() == 1);
        REQUIRE(params.statuses[0] == StatusType::Burn);
    }

    SECTION("Bad entries are reported, good ones still load") {
        auto j = nlohmann::json::parse(R"([
            { "id": "ok", "stat": "flatArmor", "category": "defensive", "min_value": 5, "max_value": 20 },
            { "id": "bad_type", "stat": "condMovingDamage", "category": "conditional",
              "condition": { "type": "while-flying" } },
            { "id": "unrouted", "stat": "condNothing", "category": "conditional",
              "condition": { "type": "while-moving" } },
            { "stat": "flatHP" },
            42
        ])");

        auto result = catalog.load_from_json(j);
        REQUIRE_FALSE(result.success());
        REQUIRE(result.loaded_count() == 1);
        REQUIRE(result.error_count() == 3);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(catalog.contains("ok"));
        REQUIRE_FALSE(catalog.contains("unrouted"));
    }

    SECTION("Missing file reports an error") {
        auto result = catalog.load_from_file("/nonexistent/affixes.json");
        REQUIRE_FALSE(result.success());
        REQUIRE(catalog.empty());
    }
}
