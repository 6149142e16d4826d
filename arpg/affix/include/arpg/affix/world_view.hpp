#pragma once

#include <arpg/core/math.hpp>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace arpg::affix {

// ============================================================================
// Player data read by the engine
// ============================================================================

struct Health {
    float current = 0.0f;
    float max = 0.0f;
};

enum class Attribute : uint8_t {
    Dexterity,
    Intelligence,
    Vitality,
    Focus
};

// Allocated stat points
struct Attributes {
    float dexterity = 0.0f;
    float intelligence = 0.0f;
    float vitality = 0.0f;
    float focus = 0.0f;

    float get(Attribute attribute) const;
    bool operator==(const Attributes& other) const = default;
};

std::optional<Attribute> parse_attribute(const std::string& name);

// ============================================================================
// Enemy status effects
// ============================================================================

enum class StatusType : uint8_t {
    Slow,
    Chill,
    Burn,
    Shock,
    Stun,
    Knockback,
    Mark
};

std::optional<StatusType> parse_status(const std::string& name);

struct EnemyInfo {
    core::Vec2 position{0.0f};
    std::vector<StatusType> statuses;

    bool has_status(StatusType status) const {
        return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
    }

    bool has_any_status(const std::vector<StatusType>& wanted) const {
        return std::any_of(wanted.begin(), wanted.end(),
                           [this](StatusType s) { return has_status(s); });
    }
};

// ============================================================================
// PlayerView - Narrow accessor over whatever stores the player entity
// ============================================================================

class PlayerView {
public:
    virtual ~PlayerView() = default;

    virtual Health health() const = 0;
    virtual core::Vec2 position() const = 0;
    virtual Attributes attributes() const = 0;
};

// ============================================================================
// EnemySource - Iteration over live enemies
// ============================================================================

class EnemySource {
public:
    using Visitor = std::function<bool(const EnemyInfo&)>;

    virtual ~EnemySource() = default;

    // Visit enemies until the visitor returns false
    virtual void for_each_enemy(const Visitor& visitor) const = 0;
};

// ============================================================================
// Plain value implementations
// ============================================================================

struct PlayerSnapshot : public PlayerView {
    Health hp;
    core::Vec2 pos{0.0f};
    Attributes attrs;

    PlayerSnapshot() = default;
    PlayerSnapshot(Health h, core::Vec2 p, Attributes a) : hp(h), pos(p), attrs(a) {}

    Health health() const override { return hp; }
    core::Vec2 position() const override { return pos; }
    Attributes attributes() const override { return attrs; }
};

class EnemyList : public EnemySource {
public:
    EnemyList() = default;
    EnemyList(std::initializer_list<EnemyInfo> enemies) : m_enemies(enemies) {}

    void add(EnemyInfo enemy) { m_enemies.push_back(std::move(enemy)); }
    void clear() { m_enemies.clear(); }
    size_t size() const { return m_enemies.size(); }

    void for_each_enemy(const Visitor& visitor) const override {
        for (const auto& enemy : m_enemies) {
            if (!visitor(enemy)) break;
        }
    }

private:
    std::vector<EnemyInfo> m_enemies;
};

} // namespace arpg::affix
