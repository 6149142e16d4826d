#include <arpg/items/item_types.hpp>

namespace arpg::items {

const char* get_gem_name(GemType type) {
    switch (type) {
        case GemType::Ruby:     return "ruby";
        case GemType::Sapphire: return "sapphire";
        case GemType::Emerald:  return "emerald";
        case GemType::Topaz:    return "topaz";
        case GemType::Diamond:  return "diamond";
        case GemType::Onyx:     return "onyx";
    }
    return "unknown";
}

std::optional<AffixCategory> parse_affix_category(const std::string& name) {
    if (name == "offensive") return AffixCategory::Offensive;
    if (name == "defensive") return AffixCategory::Defensive;
    if (name == "utility") return AffixCategory::Utility;
    if (name == "conditional") return AffixCategory::Conditional;
    return std::nullopt;
}

std::optional<GemType> parse_gem_type(const std::string& name) {
    if (name == "ruby") return GemType::Ruby;
    if (name == "sapphire") return GemType::Sapphire;
    if (name == "emerald") return GemType::Emerald;
    if (name == "topaz") return GemType::Topaz;
    if (name == "diamond") return GemType::Diamond;
    if (name == "onyx") return GemType::Onyx;
    return std::nullopt;
}

} // namespace arpg::items
