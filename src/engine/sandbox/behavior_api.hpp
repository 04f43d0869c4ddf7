// SPDX-License-Identifier: Apache-2.0
// behavior_api.hpp - Sensing and intent surface handed to behavior scripts
#pragma once
#include "engine/bot_types.hpp"
#include "engine/sandbox/value.hpp"

#include <optional>
#include <random>

namespace duel::sandbox {

using game::Vec2;

// Bound to snapshots of both bots for one invocation. Sensing reads only those copies;
// intents write only the private BotActions record, which the engine collects afterwards.
class BehaviorApi
{
public:
    BehaviorApi(
        const game::BotState &self,
        const game::BotState &enemy,
        float arena_width,
        float arena_height,
        std::mt19937 &rng);

    // sensing
    Vec2 my_position() const
    {
        return m_self.position;
    }
    float my_angle() const
    {
        return m_self.angle;
    }
    float my_health() const
    {
        return m_self.health;
    }
    Vec2 my_velocity() const
    {
        return m_self.velocity;
    }
    Vec2 enemy_position() const
    {
        return m_enemy.position;
    }
    float enemy_health() const
    {
        return m_enemy.health;
    }
    float distance_to_enemy() const;
    float arena_width() const
    {
        return m_arena_width;
    }
    float arena_height() const
    {
        return m_arena_height;
    }

    // intents
    void move_toward(Vec2 target, std::optional<float> speed = std::nullopt);
    void move_away(Vec2 target, std::optional<float> speed = std::nullopt);
    void rotate_to(float angle);
    void attack();
    void strafe(game::StrafeDirection dir);
    void stop();

    // utility
    float angle_to(Vec2 point) const;
    float distance_to(Vec2 point) const;
    float random(float min, float max);

    const game::BotActions &actions() const
    {
        return m_actions;
    }

    // Frozen script object exposing the methods above under their script names
    // (getMyPosition, moveToward, ...). Must not outlive this BehaviorApi.
    Value script_object();

    // Pure Math global; Math.random draws from this invocation's generator.
    Value math_object();

private:
    game::BotState m_self;
    game::BotState m_enemy;
    float m_arena_width;
    float m_arena_height;
    std::mt19937 &m_rng;
    game::BotActions m_actions;
};

} // namespace duel::sandbox
