// SPDX-License-Identifier: Apache-2.0
// match_config.hpp - Match tuning constants and YAML loading of configs and bot definitions
#pragma once
#include "engine/bot_types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace duel::game {

struct MatchConfig
{
    // Arena (arena units, y down). Walls are built just outside this rectangle.
    float arena_width{800.f};
    float arena_height{600.f};
    float wall_thickness{40.f};
    float spawn_inset{150.f}; // bots spawn at (inset, H/2) and (W - inset, H/2)

    float match_duration_sec{90.f};
    uint32_t tick_rate{30};
    uint32_t countdown_ms{3000};
    float base_health{100.f};

    // Movement
    float max_move_speed{10.f}; // cap on a requested/defined speed value
    float move_speed_scale{24.f}; // speed value -> units per second
    float strafe_factor{0.5f};

    // Combat
    float attack_range_tolerance{20.f};
    float armor_damage_reduction{0.05f}; // fraction of damage removed per armor point
    float knockback_per_damage{16.f}; // impulse (mass * units/s) per point of base damage
    uint32_t attack_animation_frames{10};

    // Sandbox
    uint64_t behavior_step_budget{20000};
    uint64_t seed{1}; // Math.random / api.random generator seed

    // Bot materials
    float bot_density{0.01f};
    float armor_density_factor{0.1f}; // density *= 1 + armor * factor
    float bot_friction{0.1f};
    float bot_air_friction{0.05f};
    float bot_restitution{0.3f};

    // Box2D adapter
    float units_per_meter{30.f};
    int physics_sub_steps{4};

    float tick_interval_sec() const
    {
        return tick_rate > 0 ? 1.f / static_cast<float>(tick_rate) : 0.f;
    }

    uint64_t total_ticks() const;
};

// Reads every present key of a YAML mapping onto a default MatchConfig.
// Throws YAML::Exception for unreadable/ill-typed files, std::runtime_error for invalid values.
MatchConfig load_match_config(const std::string &path);

// Applies only keys present in the YAML file onto an existing config.
void apply_match_config_overrides(MatchConfig &cfg, const std::string &path);

// Throws std::runtime_error when a value would make the engine misbehave (zero tick rate, ...).
void validate_match_config(const MatchConfig &cfg);

// Loads a bot definition document: name, shape, size, color, speed, armor,
// weapon {type, damage, cooldown, range}, behavior_code, strategy_description.
// Numeric fields are clamped to their documented ranges; missing required fields throw.
std::shared_ptr<const BotDefinition> load_bot_definition(const std::string &path);
std::shared_ptr<const BotDefinition> parse_bot_definition(const std::string &yaml_text);

// Clamps numeric fields into documented ranges and normalizes the color string.
BotDefinition clamp_bot_definition(BotDefinition def);

} // namespace duel::game
