#pragma once

#include <arpg/affix/affix_catalog.hpp>
#include <arpg/affix/bonus_channel.hpp>
#include <arpg/affix/buff_timer_manager.hpp>
#include <arpg/affix/condition_evaluator.hpp>
#include <arpg/items/equipment.hpp>

namespace arpg::affix {

// ============================================================================
// BonusRouter - Folds equipped conditional affixes into bonus channels
// ============================================================================

class BonusRouter {
public:
    explicit BonusRouter(const AffixCatalog& catalog) : m_catalog(catalog) {}

    // Per tick: evaluate equipped conditionals and start or refresh timed buffs.
    // Returns the number of buffs applied or refreshed.
    size_t update(const items::Equipment& equipment, const EvaluationContext& ctx, BuffTimerManager& buffs) const;

    // Totals of currently active conditionals. Timed affixes count while their
    // buff runs, passive ones are evaluated live. Proc keys never contribute.
    BonusTotals collect(const items::Equipment& equipment, const EvaluationContext& ctx,
                        const BuffTimerManager& buffs) const;

private:
    // Definition for a conditional affix, nullptr when it can't be evaluated
    const AffixDefinition* resolve(const items::Affix& affix) const;

    const AffixCatalog& m_catalog;
};

} // namespace arpg::affix
