#include <arpg/items/equipment.hpp>
#include <arpg/core/log.hpp>

namespace arpg::items {

const char* get_equip_slot_name(EquipSlot slot) {
    switch (slot) {
        case EquipSlot::Weapon:  return "weapon";
        case EquipSlot::Helmet:  return "helmet";
        case EquipSlot::Chest:   return "chest";
        case EquipSlot::Boots:   return "boots";
        case EquipSlot::Ring1:   return "ring1";
        case EquipSlot::Ring2:   return "ring2";
        case EquipSlot::Amulet:  return "amulet";
        case EquipSlot::Offhand: return "offhand";
        case EquipSlot::Count:   break;
    }
    return "invalid";
}

bool slot_accepts(EquipSlot slot, ItemSlot item_slot) {
    switch (slot) {
        case EquipSlot::Weapon:  return item_slot == ItemSlot::Weapon;
        case EquipSlot::Helmet:  return item_slot == ItemSlot::Helmet;
        case EquipSlot::Chest:   return item_slot == ItemSlot::Chest;
        case EquipSlot::Boots:   return item_slot == ItemSlot::Boots;
        case EquipSlot::Ring1:
        case EquipSlot::Ring2:   return item_slot == ItemSlot::Ring;
        case EquipSlot::Amulet:  return item_slot == ItemSlot::Amulet;
        case EquipSlot::Offhand: return item_slot == ItemSlot::Offhand;
        case EquipSlot::Count:   break;
    }
    return false;
}

// ============================================================================
// Equipment
// ============================================================================

std::optional<Item> Equipment::equip(EquipSlot slot, Item item) {
    if (slot == EquipSlot::Count || !slot_accepts(slot, item.slot)) {
        core::log(core::LogLevel::Warn, "[Equipment] Item '{}' does not fit slot {}",
                  item.id, get_equip_slot_name(slot));
        return item;
    }

    std::optional<Item> previous;
    auto& current = m_slots[index(slot)];
    if (current) {
        previous = std::move(*current);
    }
    current = std::make_unique<Item>(std::move(item));

    notify(slot);
    return previous;
}

std::optional<Item> Equipment::equip(Item item) {
    EquipSlot slot = EquipSlot::Weapon;
    switch (item.slot) {
        case ItemSlot::Weapon:  slot = EquipSlot::Weapon; break;
        case ItemSlot::Helmet:  slot = EquipSlot::Helmet; break;
        case ItemSlot::Chest:   slot = EquipSlot::Chest; break;
        case ItemSlot::Boots:   slot = EquipSlot::Boots; break;
        case ItemSlot::Amulet:  slot = EquipSlot::Amulet; break;
        case ItemSlot::Offhand: slot = EquipSlot::Offhand; break;
        case ItemSlot::Ring:
            // Prefer an empty ring slot, fall back to replacing ring1
            if (is_empty(EquipSlot::Ring1)) slot = EquipSlot::Ring1;
            else if (is_empty(EquipSlot::Ring2)) slot = EquipSlot::Ring2;
            else slot = EquipSlot::Ring1;
            break;
    }
    return equip(slot, std::move(item));
}

std::optional<Item> Equipment::unequip(EquipSlot slot) {
    if (slot == EquipSlot::Count) return std::nullopt;

    auto& current = m_slots[index(slot)];
    if (!current) return std::nullopt;

    Item item = std::move(*current);
    current.reset();

    notify(slot);
    return item;
}

std::optional<Gem> Equipment::socket_gem(EquipSlot slot, Gem gem) {
    if (slot == EquipSlot::Count) return std::nullopt;

    auto& current = m_slots[index(slot)];
    if (!current || !current->socket) {
        core::log(core::LogLevel::Debug, "[Equipment] No socket in slot {}", get_equip_slot_name(slot));
        return std::nullopt;
    }

    std::optional<Gem> displaced = std::move(current->socket->gem);
    current->socket->gem = std::move(gem);

    notify(slot);
    return displaced;
}

void Equipment::clear() {
    for (size_t i = 0; i < EquipSlotCount; ++i) {
        if (m_slots[i]) {
            m_slots[i].reset();
            notify(static_cast<EquipSlot>(i));
        }
    }
}

const Item* Equipment::get(EquipSlot slot) const {
    if (slot == EquipSlot::Count) return nullptr;
    return m_slots[index(slot)].get();
}

size_t Equipment::equipped_count() const {
    size_t count = 0;
    for (const auto& item : m_slots) {
        if (item) ++count;
    }
    return count;
}

void Equipment::notify(EquipSlot slot) {
    if (m_listener) {
        m_listener(slot);
    }
}

} // namespace arpg::items
