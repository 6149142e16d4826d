#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <arpg/stats/stats.hpp>

using namespace arpg::stats;
using arpg::affix::Attributes;
using arpg::affix::BonusChannel;
using arpg::affix::Health;
using arpg::settings::CombatTuning;
using Catch::Matchers::WithinAbs;

TEST_CASE("StatCalculator defaults", "[stats][calculator]") {
    CombatTuning tuning;
    FinalStats stats = StatCalculator::calculate(StatInputs{}, tuning);

    REQUIRE(stats == FinalStats{});
    REQUIRE_THAT(stats.damage, WithinAbs(10.0f, 0.001f));
    REQUIRE_THAT(stats.max_hp, WithinAbs(100.0f, 0.001f));
    REQUIRE_THAT(stats.move_speed, WithinAbs(200.0f, 0.001f));
    REQUIRE_THAT(stats.crit_multiplier, WithinAbs(1.5f, 0.001f));
}

TEST_CASE("StatCalculator damage", "[stats][calculator]") {
    CombatTuning tuning;
    StatInputs inputs;

    SECTION("Weapon, flat and percent bonuses") {
        // (10 + 10) * 1.25 = 25
        inputs.weapon_base_damage = 10.0f;
        inputs.gear.add(BonusChannel::FlatDamage, 10.0f);
        inputs.conditional.add(BonusChannel::PercentDamage, 25.0f);
        REQUIRE_THAT(StatCalculator::calculate(inputs, tuning).damage, WithinAbs(25.0f, 0.001f));
    }

    SECTION("Intelligence multiplies and the result is rounded") {
        // 12 * (1 + 5 * 0.08) = 16.8 -> 17
        inputs.weapon_base_damage = 12.0f;
        inputs.attributes.intelligence = 5.0f;
        REQUIRE_THAT(StatCalculator::calculate(inputs, tuning).damage, WithinAbs(17.0f, 0.001f));
    }

    SECTION("Unarmed uses the default weapon damage") {
        inputs.gear.add(BonusChannel::FlatDamage, 5.0f);
        REQUIRE_THAT(StatCalculator::calculate(inputs, tuning).damage, WithinAbs(15.0f, 0.001f));
    }
}

TEST_CASE("StatCalculator speeds and crit", "[stats][calculator]") {
    CombatTuning tuning;
    StatInputs inputs;
    inputs.attributes.dexterity = 10.0f;
    inputs.gear.add(BonusChannel::PercentAttackSpeed, 20.0f);
    inputs.gear.add(BonusChannel::PercentProjectileSpeed, 10.0f);
    inputs.gear.add(BonusChannel::PercentMoveSpeed, 10.0f);

    FinalStats stats = StatCalculator::calculate(inputs, tuning);
    // 1.2 * 1.3
    REQUIRE_THAT(stats.attack_speed, WithinAbs(1.56f, 0.001f));
    // 1.1 * 1.5
    REQUIRE_THAT(stats.projectile_speed, WithinAbs(1.65f, 0.001f));
    REQUIRE_THAT(stats.move_speed, WithinAbs(220.0f, 0.01f));

    SECTION("Crit chance is clamped to 1") {
        inputs.gear.add(BonusChannel::PercentCritChance, 150.0f);
        REQUIRE_THAT(StatCalculator::calculate(inputs, tuning).crit_chance, WithinAbs(1.0f, 0.0001f));
    }

    SECTION("Negative crit chance is clamped to 0") {
        inputs.gear.add(BonusChannel::PercentCritChance, -10.0f);
        REQUIRE_THAT(StatCalculator::calculate(inputs, tuning).crit_chance, WithinAbs(0.0f, 0.0001f));
    }
}

TEST_CASE("StatCalculator health and multipliers", "[stats][calculator]") {
    CombatTuning tuning;
    StatInputs inputs;
    inputs.attributes.vitality = 5.0f;
    inputs.gear.add(BonusChannel::FlatHP, 20.0f);
    inputs.gear.add(BonusChannel::PercentHP, 10.0f);
    inputs.gear.add(BonusChannel::HpRegen, 2.0f);
    inputs.conditional.add(BonusChannel::HpRegen, 8.0f);
    inputs.gear.add(BonusChannel::PercentXPGain, 15.0f);
    inputs.gear.add(BonusChannel::PercentGoldFind, 30.0f);

    FinalStats stats = StatCalculator::calculate(inputs, tuning);
    // (100 + 50 + 20) * 1.1 = 187
    REQUIRE_THAT(stats.max_hp, WithinAbs(187.0f, 0.001f));
    REQUIRE_THAT(stats.hp_regen, WithinAbs(10.0f, 0.001f));
    REQUIRE_THAT(stats.xp_multiplier, WithinAbs(1.15f, 0.0001f));
    REQUIRE_THAT(stats.gold_multiplier, WithinAbs(1.3f, 0.0001f));
}

TEST_CASE("Armor diminishing returns", "[stats][armor]") {
    CombatTuning tuning;

    REQUIRE_THAT(StatCalculator::damage_reduction(0.0f, tuning), WithinAbs(0.0f, 0.0001f));
    REQUIRE_THAT(StatCalculator::damage_reduction(100.0f, tuning), WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(StatCalculator::damage_reduction(900.0f, tuning), WithinAbs(0.9f, 0.0001f));
    REQUIRE(StatCalculator::damage_reduction(1.0e9f, tuning) < 1.0f);
    REQUIRE_THAT(StatCalculator::damage_reduction(-50.0f, tuning), WithinAbs(0.0f, 0.0001f));

    SECTION("Armor sums base and flat bonuses") {
        StatInputs inputs;
        inputs.base_armor = 60.0f;
        inputs.gear.add(BonusChannel::FlatArmor, 15.0f);
        inputs.conditional.add(BonusChannel::FlatArmor, 25.0f);
        FinalStats stats = StatCalculator::calculate(inputs, tuning);
        REQUIRE_THAT(stats.armor, WithinAbs(100.0f, 0.001f));
        REQUIRE_THAT(stats.damage_reduction, WithinAbs(0.5f, 0.0001f));
    }
}

TEST_CASE("Cooldown reduction cap", "[stats][cdr]") {
    CombatTuning tuning;

    SECTION("Focus alone") {
        // 1 - 1 / (1 + 10 * 0.05) = 0.333
        REQUIRE_THAT(StatCalculator::cooldown_reduction(0.0f, 10.0f, tuning), WithinAbs(1.0f / 3.0f, 0.0001f));
    }

    SECTION("Gear and focus combine additively") {
        REQUIRE_THAT(StatCalculator::cooldown_reduction(5.0f, 2.0f, tuning),
                     WithinAbs(0.05f + (1.0f - 1.0f / 1.1f), 0.0001f));
    }

    SECTION("Never exceeds the cap") {
        for (int focus = 0; focus <= 100; focus += 5) {
            for (int item_count = 0; item_count <= 8; ++item_count) {
                StatInputs inputs;
                inputs.attributes.focus = static_cast<float>(focus);
                for (int i = 0; i < item_count; ++i) {
                    inputs.gear.add(BonusChannel::PercentCDR, 10.0f);
                }
                float cdr = StatCalculator::calculate(inputs, tuning).cooldown_reduction;
                REQUIRE(cdr >= 0.0f);
                REQUIRE(cdr <= 0.4f);
            }
        }
        REQUIRE_THAT(StatCalculator::cooldown_reduction(80.0f, 100.0f, tuning), WithinAbs(0.4f, 0.0001f));
    }

    SECTION("Negative gear CDR is clamped to 0") {
        REQUIRE_THAT(StatCalculator::cooldown_reduction(-50.0f, 0.0f, tuning), WithinAbs(0.0f, 0.0001f));
    }

    SECTION("Tuned cap") {
        tuning.cooldown_reduction_cap = 0.25f;
        REQUIRE_THAT(StatCalculator::cooldown_reduction(40.0f, 0.0f, tuning), WithinAbs(0.25f, 0.0001f));
    }
}

TEST_CASE("StatCache recomputes only when dirty", "[stats][cache]") {
    CombatTuning tuning;
    StatInputs inputs;
    inputs.weapon_base_damage = 10.0f;
    int source_calls = 0;

    StatCache cache([&]() {
        ++source_calls;
        return inputs;
    }, tuning);

    REQUIRE(cache.is_dirty());
    REQUIRE(cache.recompute_count() == 0);

    SECTION("Repeated reads reuse the cached result") {
        FinalStats first = cache.get();
        FinalStats second = cache.get();
        REQUIRE(first == second);
        REQUIRE(cache.recompute_count() == 1);
        REQUIRE(source_calls == 1);
        REQUIRE_FALSE(cache.is_dirty());
    }

    SECTION("Dirty mark picks up new inputs") {
        REQUIRE_THAT(cache.get().damage, WithinAbs(10.0f, 0.001f));

        inputs.gear.add(BonusChannel::FlatDamage, 5.0f);
        REQUIRE_THAT(cache.get().damage, WithinAbs(10.0f, 0.001f));

        cache.mark_dirty();
        REQUIRE_THAT(cache.get().damage, WithinAbs(15.0f, 0.001f));
        REQUIRE(cache.recompute_count() == 2);
    }

    SECTION("Explicit recalculation") {
        cache.get();
        cache.recalculate();
        REQUIRE(cache.recompute_count() == 2);
    }
}

TEST_CASE("Health sync after max HP changes", "[stats][health]") {
    FinalStats stats;

    SECTION("Gaining max HP heals by the gain") {
        Health hp{80.0f, 100.0f};
        stats.max_hp = 150.0f;
        sync_player_health(hp, stats);
        REQUIRE_THAT(hp.max, WithinAbs(150.0f, 0.001f));
        REQUIRE_THAT(hp.current, WithinAbs(130.0f, 0.001f));
    }

    SECTION("Losing max HP clamps current") {
        Health hp{95.0f, 100.0f};
        stats.max_hp = 90.0f;
        sync_player_health(hp, stats);
        REQUIRE_THAT(hp.max, WithinAbs(90.0f, 0.001f));
        REQUIRE_THAT(hp.current, WithinAbs(90.0f, 0.001f));
    }

    SECTION("Losing max HP above current keeps current") {
        Health hp{50.0f, 100.0f};
        stats.max_hp = 90.0f;
        sync_player_health(hp, stats);
        REQUIRE_THAT(hp.current, WithinAbs(50.0f, 0.001f));
    }
}
