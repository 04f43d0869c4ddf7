// SPDX-License-Identifier: Apache-2.0
#include "engine/match.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "engine/box2d_world.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace duel::game {

namespace {

std::atomic<uint64_t> g_next_match_number{1};

constexpr float kHalfPi = std::numbers::pi_v<float> / 2.f;

bool finite(Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace

float compute_damage(float base_damage, float target_armor, float reduction_per_armor)
{
    return std::max(1.f, base_damage * (1.f - target_armor * reduction_per_armor));
}

std::optional<std::string> resolve_winner(const BotState &first, const BotState &second)
{
    const bool first_down = first.health <= 0.f;
    const bool second_down = second.health <= 0.f;
    if (first_down && second_down)
        return std::nullopt;
    if (first_down)
        return second.id;
    if (second_down)
        return first.id;
    if (first.health > second.health)
        return first.id;
    if (second.health > first.health)
        return second.id;
    return std::nullopt;
}

MatchEngine::MatchEngine(
    std::shared_ptr<const BotDefinition> first,
    std::shared_ptr<const BotDefinition> second,
    MatchConfig cfg,
    std::unique_ptr<phys::PhysicsWorld> world,
    std::optional<SpawnPoints> spawns)
    : m_match_id("duel-" + std::to_string(g_next_match_number.fetch_add(1, std::memory_order_relaxed)))
    , m_config(std::move(cfg))
    , m_world(std::move(world))
    , m_rng(static_cast<std::mt19937::result_type>(m_config.seed))
{
    if (!first || !second)
        throw std::invalid_argument("MatchEngine requires two bot definitions");
    validate_match_config(m_config);
    if (!m_world)
        m_world = std::make_unique<phys::Box2dWorld>(m_config.units_per_meter, m_config.physics_sub_steps);

    const float w = m_config.arena_width;
    const float h = m_config.arena_height;
    const float t = m_config.wall_thickness;
    m_walls[0] = m_world->create_static_rect(w * 0.5f, -t * 0.5f, w + t * 2.f, t);
    m_walls[1] = m_world->create_static_rect(w * 0.5f, h + t * 0.5f, w + t * 2.f, t);
    m_walls[2] = m_world->create_static_rect(-t * 0.5f, h * 0.5f, t, h + t * 2.f);
    m_walls[3] = m_world->create_static_rect(w + t * 0.5f, h * 0.5f, t, h + t * 2.f);

    SpawnPoints sp = spawns.value_or(SpawnPoints{{m_config.spawn_inset, h * 0.5f}, {w - m_config.spawn_inset, h * 0.5f}});
    const std::array<std::shared_ptr<const BotDefinition>, 2> defs{std::move(first), std::move(second)};
    const std::array<Vec2, 2> positions{sp.first, sp.second};
    for (size_t i = 0; i < 2; ++i) {
        const BotDefinition &def = *defs[i];
        phys::BodyConfig bc;
        bc.shape = def.shape;
        bc.position = positions[i];
        bc.radius = radius_for_size(def.size);
        bc.density = m_config.bot_density * (1.f + def.armor * m_config.armor_density_factor);
        bc.friction = m_config.bot_friction;
        bc.air_friction = m_config.bot_air_friction;
        bc.restitution = m_config.bot_restitution;

        BotState &bot = m_bots[i];
        bot.id = "bot-" + std::to_string(i + 1);
        bot.definition = defs[i];
        bot.body = m_world->create_body(bc);
        bot.position = m_world->get_position(bot.body);
        bot.angle = m_world->get_angle(bot.body);
        bot.velocity = {0.f, 0.f};
        bot.health = m_config.base_health;
        bot.max_health = m_config.base_health;

        m_behaviors[i] = sandbox::compile_behavior(def.behavior_code);
        if (!m_behaviors[i].ok())
            log::warn("[match] id={} {} ('{}') behavior disabled: {}", m_match_id, bot.id, def.name, m_behaviors[i].error);
    }
    m_ticks_remaining = m_config.total_ticks();
    m_world->on_collision_start([this](const phys::CollisionInfo &info) { on_collision(info); });
    metrics::runtime().active_matches.fetch_add(1, std::memory_order_relaxed);
    log::info(
        "[match] created id={} '{}' vs '{}' ticks={} seed={}",
        m_match_id,
        m_bots[0].definition->name,
        m_bots[1].definition->name,
        m_ticks_remaining,
        m_config.seed);
}

MatchEngine::~MatchEngine()
{
    m_loop_generation.fetch_add(1, std::memory_order_acq_rel);
    metrics::runtime().active_matches.fetch_sub(1, std::memory_order_relaxed);
    log::debug("[match] destroyed id={}", m_match_id);
}

void MatchEngine::start(std::shared_ptr<coro::io_scheduler> scheduler)
{
    {
        std::lock_guard lk(m_mutex);
        if (m_status != MatchStatus::waiting) {
            log::warn("[match] id={} start ignored, status={}", m_match_id, to_string(m_status));
            return;
        }
        m_status = MatchStatus::countdown;
    }
    log::info("[match] countdown id={} {}ms", m_match_id, m_config.countdown_ms);
    launch(std::move(scheduler), true);
}

void MatchEngine::start_immediate(std::shared_ptr<coro::io_scheduler> scheduler)
{
    {
        std::lock_guard lk(m_mutex);
        if (m_status != MatchStatus::waiting) {
            log::warn("[match] id={} start ignored, status={}", m_match_id, to_string(m_status));
            return;
        }
        m_status = MatchStatus::fighting;
    }
    log::info("[match] start id={}", m_match_id);
    launch(std::move(scheduler), false);
}

void MatchEngine::start_immediate()
{
    std::lock_guard lk(m_mutex);
    if (m_status != MatchStatus::waiting) {
        log::warn("[match] id={} start ignored, status={}", m_match_id, to_string(m_status));
        return;
    }
    m_status = MatchStatus::fighting;
    log::info("[match] start id={} (manual ticking)", m_match_id);
}

void MatchEngine::stop()
{
    m_loop_generation.fetch_add(1, std::memory_order_acq_rel);
    log::debug("[match] stop id={}", m_match_id);
}

void MatchEngine::launch(std::shared_ptr<coro::io_scheduler> scheduler, bool countdown)
{
    if (!scheduler)
        throw std::invalid_argument("MatchEngine::start requires a scheduler");
    auto self = shared_from_this(); // throws std::bad_weak_ptr unless owned by a shared_ptr
    uint64_t generation = m_loop_generation.load(std::memory_order_acquire);
    m_active_loops.fetch_add(1, std::memory_order_acq_rel);
    if (!scheduler->spawn(run_loop(std::move(self), scheduler, generation, countdown))) {
        m_active_loops.fetch_sub(1, std::memory_order_acq_rel);
        throw std::runtime_error("scheduler refused the match loop (shutting down?)");
    }
}

coro::task<void> MatchEngine::run_loop(
    std::shared_ptr<MatchEngine> self,
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint64_t generation,
    bool countdown)
{
    co_await scheduler->schedule();
    auto stale = [&] { return self->m_loop_generation.load(std::memory_order_acquire) != generation; };
    using clock = std::chrono::steady_clock;
    if (countdown) {
        co_await scheduler->yield_for(std::chrono::milliseconds(self->m_config.countdown_ms));
        if (!stale()) {
            std::lock_guard lk(self->m_mutex);
            if (self->m_status == MatchStatus::countdown)
                self->m_status = MatchStatus::fighting;
        }
        if (!stale())
            log::info("[match] fight id={}", self->m_match_id);
    }
    // Precise tick interval in nanoseconds to avoid integer millisecond truncation (33.333ms at 30Hz).
    const uint32_t rate = self->m_config.tick_rate;
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + rate / 2) / rate);
    auto next = clock::now();
    while (!stale()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(std::chrono::ceil<std::chrono::milliseconds>(wait_dur));
            continue;
        }
        next += tick_interval;
        self->tick();
        if (self->status() == MatchStatus::finished)
            break;
    }
    self->m_active_loops.fetch_sub(1, std::memory_order_acq_rel);
    log::debug("[match] loop exit id={} tick={}", self->m_match_id, self->get_state().tick_count);
    co_return;
}

void MatchEngine::tick()
{
    using clock = std::chrono::steady_clock;
    GameState published;
    std::shared_ptr<MatchObserver> observer;
    {
        std::lock_guard lk(m_mutex);
        if (m_status != MatchStatus::fighting)
            return;
        auto tick_start = clock::now();
        advance_locked();
        published = snapshot_locked();
        observer = m_observer;
        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
    }
    if (observer)
        observer->on_update(published);
}

void MatchEngine::advance_locked()
{
    ++m_tick;
    m_damage_events.clear();

    if (m_ticks_remaining > 0)
        --m_ticks_remaining;
    if (m_ticks_remaining == 0) {
        finish_locked("time");
        return;
    }

    // Both decisions are taken against the same pre-action state.
    std::array<BotActions, 2> actions;
    for (size_t i = 0; i < 2; ++i)
        actions[i] = decide_locked(i);
    for (size_t i = 0; i < 2; ++i)
        apply_actions_locked(i, actions[i]);

    m_world->step(m_config.tick_interval_sec());
    sync_from_physics_locked();

    if (m_bots[0].health <= 0.f || m_bots[1].health <= 0.f)
        finish_locked("knockout");
}

BotActions MatchEngine::decide_locked(size_t index)
{
    sandbox::BehaviorApi api(m_bots[index], m_bots[1 - index], m_config.arena_width, m_config.arena_height, m_rng);
    if (!sandbox::execute_behavior(m_behaviors[index], api, m_tick, m_config.behavior_step_budget, m_bots[index].id))
        return {};
    return api.actions();
}

void MatchEngine::apply_actions_locked(size_t index, const BotActions &a)
{
    BotState &bot = m_bots[index];
    const BotState &enemy = m_bots[1 - index];
    const BotDefinition &def = *bot.definition;

    if (a.stop) {
        m_world->set_velocity(bot.body, {0.f, 0.f});
    } else {
        if (a.move_target && finite(*a.move_target)) {
            float dx = a.move_target->x - bot.position.x;
            float dy = a.move_target->y - bot.position.y;
            float dist = std::hypot(dx, dy);
            if (dist > 1.f) {
                float requested = a.move_speed && std::isfinite(*a.move_speed) ? *a.move_speed : def.speed;
                float speed = std::min(requested, m_config.max_move_speed) * m_config.move_speed_scale;
                if (a.move_away)
                    speed = -speed;
                m_world->set_velocity(bot.body, {dx / dist * speed, dy / dist * speed});
            }
        }
        if (a.strafe) {
            float bearing = std::atan2(enemy.position.y - bot.position.y, enemy.position.x - bot.position.x);
            float angle = *a.strafe == StrafeDirection::left ? bearing - kHalfPi : bearing + kHalfPi;
            float s = def.speed * m_config.move_speed_scale * m_config.strafe_factor;
            Vec2 v = m_world->get_velocity(bot.body);
            m_world->set_velocity(bot.body, {v.x + std::cos(angle) * s, v.y + std::sin(angle) * s});
        }
    }
    if (a.rotate_target && std::isfinite(*a.rotate_target))
        m_world->set_angle(bot.body, *a.rotate_target);
    if (a.attack && bot.weapon_cooldown_remaining <= 0.f)
        resolve_attack_locked(index);
}

void MatchEngine::resolve_attack_locked(size_t attacker_index)
{
    BotState &attacker = m_bots[attacker_index];
    BotState &target = m_bots[1 - attacker_index];
    const WeaponConfig &weapon = attacker.definition->weapon;
    auto &rt = metrics::runtime();
    rt.attacks_total.fetch_add(1, std::memory_order_relaxed);

    float dx = target.position.x - attacker.position.x;
    float dy = target.position.y - attacker.position.y;
    float dist = std::hypot(dx, dy);
    if (dist <= weapon.range + m_config.attack_range_tolerance) {
        float damage = compute_damage(weapon.damage, target.definition->armor, m_config.armor_damage_reduction);
        target.health = std::max(0.f, target.health - damage);
        if (dist > 0.f) {
            float impulse = weapon.damage * m_config.knockback_per_damage;
            m_world->apply_impulse(target.body, {dx / dist * impulse, dy / dist * impulse});
        }
        m_damage_events.push_back({attacker.id, target.id, damage, target.position, m_tick});
        rt.hits_total.fetch_add(1, std::memory_order_relaxed);
        log::debug(
            "[match] hit id={} tick={} {} -> {} dmg={} dist={} hp={}",
            m_match_id,
            m_tick,
            attacker.id,
            target.id,
            damage,
            dist,
            target.health);
    } else {
        log::trace("[match] whiff id={} tick={} {} dist={} range={}", m_match_id, m_tick, attacker.id, dist, weapon.range);
    }
    // Hit or miss, the swing consumes the cooldown.
    attacker.weapon_cooldown_remaining = weapon.cooldown_ms;
    attacker.attacking = true;
    attacker.attack_animation_frame = 0;
}

void MatchEngine::sync_from_physics_locked()
{
    const float interval_ms = 1000.f / static_cast<float>(m_config.tick_rate);
    for (BotState &bot : m_bots) {
        bot.position = m_world->get_position(bot.body);
        bot.angle = m_world->get_angle(bot.body);
        bot.velocity = m_world->get_velocity(bot.body);
        bot.weapon_cooldown_remaining = std::max(0.f, bot.weapon_cooldown_remaining - interval_ms);
        if (bot.attacking) {
            ++bot.attack_animation_frame;
            if (bot.attack_animation_frame > m_config.attack_animation_frames) {
                bot.attacking = false;
                bot.attack_animation_frame = 0;
            }
        }
    }
}

void MatchEngine::finish_locked(const char *reason)
{
    m_status = MatchStatus::finished;
    m_winner = resolve_winner(m_bots[0], m_bots[1]);
    m_loop_generation.fetch_add(1, std::memory_order_acq_rel);
    metrics::runtime().matches_finished.fetch_add(1, std::memory_order_relaxed);
    log::info(
        "[match] over id={} reason={} tick={} winner={} hp=({}, {})",
        m_match_id,
        reason,
        m_tick,
        m_winner ? *m_winner : std::string("draw"),
        m_bots[0].health,
        m_bots[1].health);
}

GameState MatchEngine::snapshot_locked() const
{
    GameState s;
    s.bots = m_bots;
    s.status = m_status;
    s.winner = m_winner;
    s.tick_count = m_tick;
    s.time_remaining = static_cast<float>(m_ticks_remaining) / static_cast<float>(m_config.tick_rate);
    s.damage_events = m_damage_events;
    s.arena_width = m_config.arena_width;
    s.arena_height = m_config.arena_height;
    return s;
}

GameState MatchEngine::get_state() const
{
    std::lock_guard lk(m_mutex);
    return snapshot_locked();
}

MatchStatus MatchEngine::status() const
{
    std::lock_guard lk(m_mutex);
    return m_status;
}

void MatchEngine::on_update(std::shared_ptr<MatchObserver> observer)
{
    std::lock_guard lk(m_mutex);
    m_observer = std::move(observer);
}

std::string MatchEngine::behavior_error(size_t bot_index) const
{
    if (bot_index >= m_behaviors.size())
        throw std::out_of_range("bot index out of range");
    return m_behaviors[bot_index].error;
}

void MatchEngine::on_collision(const phys::CollisionInfo &info)
{
    metrics::runtime().collisions_total.fetch_add(1, std::memory_order_relaxed);
    bool a_is_bot = info.body_a == m_bots[0].body || info.body_a == m_bots[1].body;
    bool b_is_bot = info.body_b == m_bots[0].body || info.body_b == m_bots[1].body;
    if (a_is_bot && b_is_bot)
        log::trace("[match] bots collided id={} tick={} depth={}", m_match_id, m_tick, info.depth);
}

} // namespace duel::game
