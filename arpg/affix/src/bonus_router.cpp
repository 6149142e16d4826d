#include <arpg/affix/bonus_router.hpp>
#include <arpg/affix/conditional_routing.hpp>
#include <arpg/core/log.hpp>

namespace arpg::affix {

const AffixDefinition* BonusRouter::resolve(const items::Affix& affix) const {
    if (!affix.is_conditional()) return nullptr;

    const AffixDefinition* def = m_catalog.find_by_stat(affix.stat_key);
    if (!def || !def->condition) {
        core::log(core::LogLevel::Trace, "[Affix] No conditional definition for stat '{}'", affix.stat_key);
        return nullptr;
    }
    return def;
}

size_t BonusRouter::update(const items::Equipment& equipment, const EvaluationContext& ctx,
                           BuffTimerManager& buffs) const {
    if (!ctx.player) return 0;

    size_t activated = 0;
    equipment.for_each_item([&](const items::Item& item) {
        for (const auto& affix : item.affixes) {
            const AffixDefinition* def = resolve(affix);
            if (!def || !def->is_timed()) continue;

            if (evaluate_condition(*def->condition, ctx)) {
                float value = core::finite_or(affix.rolled_value, 0.0f);
                if (buffs.activate(affix.stat_key, value, def->buff_duration) != BuffActivation::Ignored) {
                    ++activated;
                }
            }
        }
    });
    return activated;
}

BonusTotals BonusRouter::collect(const items::Equipment& equipment, const EvaluationContext& ctx,
                                 const BuffTimerManager& buffs) const {
    BonusTotals totals;
    if (!ctx.player) return totals;

    equipment.for_each_item([&](const items::Item& item) {
        for (const auto& affix : item.affixes) {
            const AffixDefinition* def = resolve(affix);
            if (!def) continue;

            auto route = find_conditional_route(affix.stat_key);
            if (!route || route->is_proc) continue;

            bool active = def->is_timed()
                ? buffs.is_active(affix.stat_key)
                : evaluate_condition(*def->condition, ctx);

            if (active) {
                totals.add(route->channel, affix.rolled_value);
            }
        }
    });
    return totals;
}

} // namespace arpg::affix
