#include <arpg/affix/world_view.hpp>

namespace arpg::affix {

float Attributes::get(Attribute attribute) const {
    switch (attribute) {
        case Attribute::Dexterity:    return dexterity;
        case Attribute::Intelligence: return intelligence;
        case Attribute::Vitality:     return vitality;
        case Attribute::Focus:        return focus;
    }
    return 0.0f;
}

std::optional<Attribute> parse_attribute(const std::string& name) {
    if (name == "dexterity") return Attribute::Dexterity;
    if (name == "intelligence") return Attribute::Intelligence;
    if (name == "vitality") return Attribute::Vitality;
    if (name == "focus") return Attribute::Focus;
    return std::nullopt;
}

std::optional<StatusType> parse_status(const std::string& name) {
    if (name == "slow") return StatusType::Slow;
    if (name == "chill") return StatusType::Chill;
    if (name == "burn") return StatusType::Burn;
    if (name == "shock") return StatusType::Shock;
    if (name == "stun") return StatusType::Stun;
    if (name == "knockback") return StatusType::Knockback;
    if (name == "mark") return StatusType::Mark;
    return std::nullopt;
}

} // namespace arpg::affix
