// SPDX-License-Identifier: Apache-2.0
// match.hpp - 1v1 match state machine and fixed-rate tick loop
#pragma once
#include "engine/bot_types.hpp"
#include "engine/match_config.hpp"
#include "engine/physics.hpp"
#include "engine/sandbox/sandbox.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace duel::game {

// Receives exactly one snapshot per executed tick, after the tick completed (the final
// tick's snapshot already carries status finished). Called without engine locks held.
class MatchObserver
{
public:
    virtual ~MatchObserver() = default;
    virtual void on_update(const GameState &state) = 0;
};

struct SpawnPoints
{
    Vec2 first;
    Vec2 second;
};

// max(1, base * (1 - armor * reduction_per_armor))
float compute_damage(float base_damage, float target_armor, float reduction_per_armor = 0.05f);

// Both down -> draw; one down -> the other; otherwise higher health wins, ties draw.
std::optional<std::string> resolve_winner(const BotState &first, const BotState &second);

// Owns the physics world, both bots and their compiled behaviors. Hold in a shared_ptr when
// using the scheduler-driven start() variants: the tick loop keeps the engine alive.
class MatchEngine : public std::enable_shared_from_this<MatchEngine>
{
public:
    // A null world selects the Box2D adapter configured from cfg.
    MatchEngine(
        std::shared_ptr<const BotDefinition> first,
        std::shared_ptr<const BotDefinition> second,
        MatchConfig cfg = {},
        std::unique_ptr<phys::PhysicsWorld> world = nullptr,
        std::optional<SpawnPoints> spawns = std::nullopt);
    ~MatchEngine();

    MatchEngine(const MatchEngine &) = delete;
    MatchEngine &operator=(const MatchEngine &) = delete;

    // waiting -> countdown; fighting after countdown_ms, then ticks on the scheduler.
    void start(std::shared_ptr<coro::io_scheduler> scheduler);
    // waiting -> fighting at once, ticks on the scheduler.
    void start_immediate(std::shared_ptr<coro::io_scheduler> scheduler);
    // waiting -> fighting at once; the caller drives tick().
    void start_immediate();
    // Halts the tick loop. Status is left untouched; an in-flight tick completes.
    void stop();

    // One simulation step. No-op unless fighting.
    void tick();

    GameState get_state() const;
    void on_update(std::shared_ptr<MatchObserver> observer);

    MatchStatus status() const;
    bool loop_running() const
    {
        return m_active_loops.load(std::memory_order_acquire) > 0;
    }
    const std::string &match_id() const
    {
        return m_match_id;
    }
    const MatchConfig &config() const
    {
        return m_config;
    }
    // "Compilation error: ..." for a bot whose behavior failed to compile, else empty.
    std::string behavior_error(size_t bot_index) const;

private:
    static coro::task<void> run_loop(
        std::shared_ptr<MatchEngine> self,
        std::shared_ptr<coro::io_scheduler> scheduler,
        uint64_t generation,
        bool countdown);
    void launch(std::shared_ptr<coro::io_scheduler> scheduler, bool countdown);

    // Steps 1-7 of a tick; the caller publishes.
    void advance_locked();
    BotActions decide_locked(size_t index);
    void apply_actions_locked(size_t index, const BotActions &actions);
    void resolve_attack_locked(size_t attacker_index);
    void sync_from_physics_locked();
    void finish_locked(const char *reason);
    GameState snapshot_locked() const;
    void on_collision(const phys::CollisionInfo &info);

    std::string m_match_id;
    MatchConfig m_config;
    std::unique_ptr<phys::PhysicsWorld> m_world;
    std::array<BotState, 2> m_bots;
    std::array<sandbox::CompiledBehavior, 2> m_behaviors;
    std::array<phys::BodyHandle, 4> m_walls;

    MatchStatus m_status{MatchStatus::waiting};
    std::optional<std::string> m_winner;
    uint64_t m_tick{0};
    uint64_t m_ticks_remaining{0};
    std::vector<DamageEvent> m_damage_events;
    std::mt19937 m_rng;

    std::shared_ptr<MatchObserver> m_observer;
    mutable std::mutex m_mutex;
    std::atomic<uint64_t> m_loop_generation{0}; // bumped by stop(); a loop exits once it is stale
    std::atomic<int> m_active_loops{0};
};

} // namespace duel::game
