#pragma once

#include <arpg/affix/bonus_channel.hpp>
#include <arpg/items/item_types.hpp>

namespace arpg::affix {

// Fixed bonus granted by a socketed gem
struct GemBonus {
    BonusChannel channel = BonusChannel::FlatDamage;
    float value = 0.0f;
};

const GemBonus& get_gem_bonus(items::GemType type);

} // namespace arpg::affix
