#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace arpg::items {

// ============================================================================
// Enums
// ============================================================================

enum class Rarity : uint8_t {
    Normal,
    Magic,
    Rare,       // Rare and above may roll conditional affixes
    Unique
};

enum class ItemSlot : uint8_t {
    Weapon,
    Helmet,
    Chest,
    Boots,
    Ring,
    Amulet,
    Offhand
};

enum class AffixCategory : uint8_t {
    Offensive,
    Defensive,
    Utility,
    Conditional
};

enum class GemType : uint8_t {
    Ruby,
    Sapphire,
    Emerald,
    Topaz,
    Diamond,
    Onyx
};

// ============================================================================
// Affix - A rolled modifier owned by an item
// ============================================================================

struct Affix {
    std::string id;             // Definition id, "cond_kill_streak_speed"
    std::string stat_key;       // Channel or conditional key, "condKillStreakSpeed"
    AffixCategory category = AffixCategory::Offensive;
    float rolled_value = 0.0f;
    float min_value = 0.0f;
    float max_value = 0.0f;

    bool is_conditional() const { return category == AffixCategory::Conditional; }
};

// ============================================================================
// Gem / Socket
// ============================================================================

struct Gem {
    std::string id;
    GemType type = GemType::Ruby;
};

struct ItemSocket {
    std::optional<Gem> gem;
};

// ============================================================================
// Item
// ============================================================================

struct BaseStats {
    std::optional<float> damage;
    std::optional<float> armor;
};

struct Item {
    std::string id;
    std::string name;
    ItemSlot slot = ItemSlot::Weapon;
    Rarity rarity = Rarity::Normal;
    int level = 1;

    BaseStats base_stats;
    std::vector<Affix> affixes;
    std::optional<ItemSocket> socket;

    // Socketed gem, nullptr if no socket or empty socket
    const Gem* socketed_gem() const {
        return (socket && socket->gem) ? &*socket->gem : nullptr;
    }
};

// ============================================================================
// Helpers
// ============================================================================

const char* get_gem_name(GemType type);

std::optional<AffixCategory> parse_affix_category(const std::string& name);
std::optional<GemType> parse_gem_type(const std::string& name);

} // namespace arpg::items
