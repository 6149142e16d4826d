#include <arpg/affix/gem_bonus.hpp>

namespace arpg::affix {

namespace {

constexpr GemBonus k_ruby     {BonusChannel::FlatDamage,        10.0f};
constexpr GemBonus k_sapphire {BonusChannel::FlatHP,            20.0f};
constexpr GemBonus k_emerald  {BonusChannel::PercentMoveSpeed,   5.0f};
constexpr GemBonus k_topaz    {BonusChannel::PercentXPGain,      5.0f};
constexpr GemBonus k_diamond  {BonusChannel::FlatArmor,          5.0f};
constexpr GemBonus k_onyx     {BonusChannel::PercentCritChance,  3.0f};

} // anonymous namespace

const GemBonus& get_gem_bonus(items::GemType type) {
    switch (type) {
        case items::GemType::Ruby:     return k_ruby;
        case items::GemType::Sapphire: return k_sapphire;
        case items::GemType::Emerald:  return k_emerald;
        case items::GemType::Topaz:    return k_topaz;
        case items::GemType::Diamond:  return k_diamond;
        case items::GemType::Onyx:     return k_onyx;
    }
    return k_ruby;
}

} // namespace arpg::affix
