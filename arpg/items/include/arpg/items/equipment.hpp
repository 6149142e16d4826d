#pragma once

#include <arpg/items/item_types.hpp>
#include <array>
#include <functional>
#include <memory>
#include <optional>

namespace arpg::items {

// ============================================================================
// EquipSlot - The eight paper-doll slots
// ============================================================================

enum class EquipSlot : uint8_t {
    Weapon,
    Helmet,
    Chest,
    Boots,
    Ring1,
    Ring2,
    Amulet,
    Offhand,
    Count
};

inline constexpr size_t EquipSlotCount = static_cast<size_t>(EquipSlot::Count);

const char* get_equip_slot_name(EquipSlot slot);

// Does an item of this slot type fit into the paper-doll slot
bool slot_accepts(EquipSlot slot, ItemSlot item_slot);

// ============================================================================
// Equipment - Owns the currently equipped items
// ============================================================================

class Equipment {
public:
    using ChangeListener = std::function<void(EquipSlot)>;

    Equipment() = default;
    Equipment(const Equipment&) = delete;
    Equipment& operator=(const Equipment&) = delete;

    // Equip into a specific slot. Returns the previously equipped item, or
    // nullopt when the slot was empty. An item that doesn't fit the slot is
    // handed back unchanged and nothing is equipped.
    std::optional<Item> equip(EquipSlot slot, Item item);

    // Equip into the natural slot for the item. Rings prefer an empty ring slot.
    std::optional<Item> equip(Item item);

    // Remove the item from a slot
    std::optional<Item> unequip(EquipSlot slot);

    // Insert a gem into the item's socket. Returns the displaced gem.
    // Returns nullopt and does nothing if the slot is empty or has no socket.
    std::optional<Gem> socket_gem(EquipSlot slot, Gem gem);

    void clear();

    // Queries
    const Item* get(EquipSlot slot) const;
    bool is_empty(EquipSlot slot) const { return get(slot) == nullptr; }
    size_t equipped_count() const;

    // Visit equipped items in slot order (weapon first)
    template<typename Fn>
    void for_each_item(Fn&& fn) const {
        for (const auto& item : m_slots) {
            if (item) fn(*item);
        }
    }

    // Fired after any change to a slot (equip, unequip, socket)
    void set_change_listener(ChangeListener listener) { m_listener = std::move(listener); }

private:
    void notify(EquipSlot slot);
    static size_t index(EquipSlot slot) { return static_cast<size_t>(slot); }

    std::array<std::unique_ptr<Item>, EquipSlotCount> m_slots;
    ChangeListener m_listener;
};

} // namespace arpg::items
