// SPDX-License-Identifier: Apache-2.0
// bot_types.hpp - Bot definitions, runtime bot state and match snapshots
#pragma once
#include "engine/physics.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duel::game {

using phys::Vec2;

enum class WeaponType
{
    spinner,
    flipper,
    hammer,
    saw,
    lance,
    flamethrower
};

struct WeaponConfig
{
    WeaponType type{WeaponType::spinner};
    float damage{5.f}; // 1-10
    float cooldown_ms{1000.f}; // 200-2000
    float range{60.f}; // arena units, 20-120

    bool operator==(const WeaponConfig &) const = default;
};

// Externally supplied, already validated/clamped. Never mutated once a match holds it.
struct BotDefinition
{
    std::string name;
    phys::BodyShape shape{phys::BodyShape::circle};
    float size{3.f}; // 1-5
    std::string color{"#888888"};
    float speed{5.f}; // 1-10
    float armor{5.f}; // 1-10
    WeaponConfig weapon;
    std::string behavior_code; // statement list run with (api, tick)
    std::string strategy_description;

    bool operator==(const BotDefinition &) const = default;
};

struct BotState
{
    std::string id;
    std::shared_ptr<const BotDefinition> definition;
    Vec2 position;
    float angle{0.f}; // radians
    Vec2 velocity; // arena units per second
    float health{0.f};
    float max_health{0.f};
    float weapon_cooldown_remaining{0.f}; // ms, never negative
    bool attacking{false};
    uint32_t attack_animation_frame{0};
    phys::BodyHandle body;

    bool operator==(const BotState &) const = default;
};

enum class StrafeDirection
{
    left,
    right
};

// Intents recorded by one behavior invocation. Rebuilt every tick.
struct BotActions
{
    std::optional<Vec2> move_target;
    bool move_away{false};
    std::optional<float> move_speed;
    std::optional<float> rotate_target;
    bool attack{false};
    std::optional<StrafeDirection> strafe;
    bool stop{false};

    bool operator==(const BotActions &) const = default;
};

struct DamageEvent
{
    std::string attacker_id;
    std::string target_id;
    float damage{0.f};
    Vec2 position;
    uint64_t tick{0};

    bool operator==(const DamageEvent &) const = default;
};

enum class MatchStatus
{
    waiting,
    countdown,
    fighting,
    finished
};

// Snapshot handed to observers and get_state() callers. Independent copy of engine state.
struct GameState
{
    std::array<BotState, 2> bots;
    MatchStatus status{MatchStatus::waiting};
    std::optional<std::string> winner; // nullopt = undecided or draw
    uint64_t tick_count{0};
    float time_remaining{0.f}; // seconds
    std::vector<DamageEvent> damage_events;
    float arena_width{0.f};
    float arena_height{0.f};

    bool operator==(const GameState &) const = default;
};

const char *to_string(MatchStatus s);
const char *to_string(WeaponType t);
std::optional<WeaponType> parse_weapon_type(std::string_view name);

// Body radius for a definition size (1..5 -> 15..35 units).
float radius_for_size(float size);

} // namespace duel::game
