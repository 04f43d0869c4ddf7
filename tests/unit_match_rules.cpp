// SPDX-License-Identifier: Apache-2.0
// Match engine rules on a deterministic fake physics world: movement, combat, cooldowns,
// knockback, win resolution and failure containment.
#include "common/metrics.hpp"
#include "engine/match.hpp"
#include "fake_physics_world.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace duel;
using duel::game::MatchEngine;
using duel::game::MatchStatus;

namespace {

bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

std::shared_ptr<const game::BotDefinition> bot(const std::string &name, const std::string &code)
{
    game::BotDefinition d;
    d.name = name;
    d.behavior_code = code;
    d.size = 3.f;
    d.speed = 5.f;
    d.armor = 10.f;
    d.weapon.damage = 10.f;
    d.weapon.cooldown_ms = 1000.f;
    d.weapon.range = 50.f;
    return std::make_shared<const game::BotDefinition>(d);
}

std::shared_ptr<const game::BotDefinition> with(std::shared_ptr<const game::BotDefinition> base, auto &&edit)
{
    game::BotDefinition d = *base;
    edit(d);
    return std::make_shared<const game::BotDefinition>(d);
}

struct Rig
{
    test::FakePhysicsWorld *world{nullptr};
    std::shared_ptr<MatchEngine> engine;
};

Rig make_rig(
    std::shared_ptr<const game::BotDefinition> a,
    std::shared_ptr<const game::BotDefinition> b,
    game::Vec2 pa,
    game::Vec2 pb,
    game::MatchConfig cfg = {})
{
    auto world = std::make_unique<test::FakePhysicsWorld>();
    Rig r;
    r.world = world.get();
    r.engine = std::make_shared<MatchEngine>(a, b, cfg, std::move(world), game::SpawnPoints{pa, pb});
    return r;
}

struct CountingObserver : game::MatchObserver
{
    void on_update(const game::GameState &s) override
    {
        ++calls;
        last = s;
    }
    int calls{0};
    game::GameState last;
};

} // namespace

int main()
{
    // Damage formula and winner resolution.
    {
        assert(near(game::compute_damage(10.f, 10.f), 5.f));
        assert(near(game::compute_damage(8.f, 2.f), 7.2f));
        assert(near(game::compute_damage(1.f, 10.f), 1.f)); // floor of 1
        assert(near(game::compute_damage(1.f, 1.f), 1.f));
        game::BotState a, b;
        a.id = "bot-1";
        b.id = "bot-2";
        a.health = 40.f;
        b.health = 30.f;
        assert(game::resolve_winner(a, b) == std::optional<std::string>("bot-1"));
        b.health = 50.f;
        assert(game::resolve_winner(a, b) == std::optional<std::string>("bot-2"));
        b.health = 40.f;
        assert(!game::resolve_winner(a, b));
        a.health = 0.f;
        assert(game::resolve_winner(a, b) == std::optional<std::string>("bot-2"));
        b.health = 0.f;
        assert(!game::resolve_winner(a, b));
    }
    // Construction: walls, bodies, initial state; ticks before start are ignored.
    {
        auto r = make_rig(bot("A", "api.stop();"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f});
        assert(r.world->static_rects == 4);
        auto s = r.engine->get_state();
        assert(s.status == MatchStatus::waiting);
        assert(s.tick_count == 0);
        assert(s.bots[0].id == "bot-1" && s.bots[1].id == "bot-2");
        assert(s.bots[0].health == 100.f && s.bots[0].max_health == 100.f);
        assert(s.bots[0].position == (game::Vec2{100.f, 300.f}));
        assert(!s.winner);
        assert(r.engine->match_id().rfind("duel-", 0) == 0);
        r.engine->tick();
        assert(r.engine->get_state().tick_count == 0);
        // Heavier armor gives a denser body.
        auto &body = r.world->at(s.bots[0].body);
        assert(near(body.config.density, 0.01f * 2.f, 1e-6f));
        assert(near(body.config.radius, 25.f));
    }
    // A hit in range: damage, event, knockback along attacker -> target, cooldown, animation.
    {
        auto r = make_rig(bot("A", "api.attack();"), bot("B", "let idle = 1;"), {100.f, 300.f}, {160.f, 300.f});
        r.engine->start_immediate();
        assert(r.engine->status() == MatchStatus::fighting);
        r.engine->tick();
        auto s = r.engine->get_state();
        assert(s.tick_count == 1);
        assert(near(s.bots[1].health, 95.f));
        assert(s.damage_events.size() == 1);
        const auto &ev = s.damage_events[0];
        assert(ev.attacker_id == "bot-1" && ev.target_id == "bot-2");
        assert(near(ev.damage, 5.f));
        assert(ev.position == (game::Vec2{160.f, 300.f}));
        assert(ev.tick == 1);
        assert(r.world->impulses.size() == 1);
        assert(r.world->impulses[0].body == s.bots[1].body);
        assert(near(r.world->impulses[0].impulse.x, 10.f * 16.f));
        assert(near(r.world->impulses[0].impulse.y, 0.f));
        assert(s.bots[1].velocity.x > 0.f); // pushed away from the attacker
        assert(s.bots[1].position.x > 160.f);
        assert(near(s.bots[0].weapon_cooldown_remaining, 1000.f - 1000.f / 30.f, 0.01f));
        assert(s.bots[0].attacking);

        // Events are per tick; the cooldown blocks further swings until it has elapsed.
        int hits = 1;
        uint64_t second_hit_tick = 0;
        for (int i = 0; i < 40; ++i) {
            r.engine->tick();
            auto st = r.engine->get_state();
            assert(st.bots[0].weapon_cooldown_remaining >= 0.f);
            if (st.tick_count == 10)
                assert(st.bots[0].attacking && st.bots[0].attack_animation_frame == 10);
            if (st.tick_count == 11 && st.damage_events.empty())
                assert(!st.bots[0].attacking);
            if (!st.damage_events.empty()) {
                ++hits;
                if (!second_hit_tick)
                    second_hit_tick = st.tick_count;
            }
        }
        assert(hits == 2);
        assert(second_hit_tick >= 31 && second_hit_tick <= 32);
    }
    // A miss still consumes the cooldown and plays the swing.
    {
        auto r = make_rig(bot("A", "api.attack();"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f});
        r.engine->start_immediate();
        r.engine->tick();
        auto s = r.engine->get_state();
        assert(s.damage_events.empty());
        assert(s.bots[1].health == 100.f);
        assert(s.bots[0].weapon_cooldown_remaining > 900.f);
        assert(s.bots[0].attacking);
        assert(r.world->impulses.empty());
    }
    // Range boundary includes the tolerance.
    {
        auto r = make_rig(bot("A", "api.attack();"), bot("B", "api.stop();"), {100.f, 300.f}, {170.f, 300.f});
        r.engine->start_immediate();
        r.engine->tick();
        assert(r.engine->get_state().damage_events.size() == 1); // 70 <= 50 + 20
        auto r2 = make_rig(bot("A", "api.attack();"), bot("B", "api.stop();"), {100.f, 300.f}, {171.f, 300.f});
        r2.engine->start_immediate();
        r2.engine->tick();
        assert(r2.engine->get_state().damage_events.empty());
    }
    // Movement intents become velocities.
    {
        auto r = make_rig(
            bot("A", "api.moveToward({x: 400, y: 300});"),
            bot("B", "api.moveAway(api.getEnemyPosition());"),
            {100.f, 300.f},
            {400.f, 300.f});
        r.engine->start_immediate();
        r.engine->tick();
        auto s = r.engine->get_state();
        assert(near(s.bots[0].velocity.x, 5.f * 24.f));
        assert(near(s.bots[0].velocity.y, 0.f));
        assert(near(s.bots[0].position.x, 100.f + 5.f * 24.f / 30.f));
        assert(near(s.bots[1].velocity.x, 5.f * 24.f)); // away from bot-1 is +x
        // A requested speed above the cap is clamped.
        auto fast = make_rig(
            bot("A", "api.moveToward({x: 100, y: 500}, 99);"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f});
        fast.engine->start_immediate();
        fast.engine->tick();
        assert(near(fast.engine->get_state().bots[0].velocity.y, 10.f * 24.f));
        // Within one unit of the target nothing changes.
        auto there = make_rig(
            bot("A", "api.moveToward({x: 100.5, y: 300});"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f});
        there.engine->start_immediate();
        there.engine->tick();
        assert(near(there.engine->get_state().bots[0].velocity.x, 0.f));
    }
    // Strafe is perpendicular to the enemy bearing and adds to the current velocity.
    {
        auto r = make_rig(bot("A", "api.strafe('left');"), bot("B", "api.strafe('right');"), {100.f, 300.f}, {400.f, 300.f});
        r.engine->start_immediate();
        r.engine->tick();
        auto s = r.engine->get_state();
        float strafe_speed = 5.f * 24.f * 0.5f;
        assert(near(s.bots[0].velocity.x, 0.f) && near(s.bots[0].velocity.y, -strafe_speed));
        // bot-2 faces -x; its right is bearing + 90deg = -90deg
        assert(near(s.bots[1].velocity.x, 0.f, 1e-2f) && near(s.bots[1].velocity.y, -strafe_speed, 1e-2f));
        r.engine->tick();
        assert(near(r.engine->get_state().bots[0].velocity.y, -2.f * strafe_speed, 0.05f));
    }
    // stop zeroes velocity and skips movement, but rotation and attack still apply.
    {
        auto r = make_rig(
            bot("A", "api.moveToward({x: 400, y: 300}); api.strafe('left'); api.stop(); api.rotateTo(1.25); api.attack();"),
            bot("B", "let idle = 1;"),
            {100.f, 300.f},
            {150.f, 300.f});
        r.world->bodies[4].velocity = {30.f, 30.f};
        r.engine->start_immediate();
        r.engine->tick();
        auto s = r.engine->get_state();
        assert(near(s.bots[0].velocity.x, 0.f) && near(s.bots[0].velocity.y, 0.f));
        assert(near(s.bots[0].angle, 1.25f));
        assert(s.damage_events.size() == 1);
    }
    // Knockout ends the match on that tick; later ticks are no-ops.
    {
        game::MatchConfig cfg;
        cfg.base_health = 10.f;
        auto a = with(bot("A", "api.attack();"), [](game::BotDefinition &d) { d.weapon.cooldown_ms = 200.f; });
        auto b = with(bot("B", "let idle = 1;"), [](game::BotDefinition &d) { d.armor = 1.f; });
        auto r = make_rig(a, b, {100.f, 300.f}, {140.f, 300.f}, cfg);
        auto obs = std::make_shared<CountingObserver>();
        r.engine->on_update(obs);
        r.engine->start_immediate();
        int guard = 0;
        while (r.engine->status() != MatchStatus::finished && guard++ < 100)
            r.engine->tick();
        auto s = r.engine->get_state();
        assert(s.status == MatchStatus::finished);
        assert(s.winner == std::optional<std::string>("bot-1"));
        assert(s.bots[1].health == 0.f); // floored, never negative
        assert(obs->calls == static_cast<int>(s.tick_count));
        assert(obs->last == s);
        uint64_t final_tick = s.tick_count;
        r.engine->tick();
        assert(r.engine->get_state().tick_count == final_tick);
        assert(obs->calls == static_cast<int>(final_tick));
    }
    // Timeout: an even fight is a draw; the healthier bot wins otherwise.
    {
        game::MatchConfig cfg;
        cfg.match_duration_sec = 1.f;
        auto r = make_rig(bot("A", "api.stop();"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f}, cfg);
        r.engine->start_immediate();
        for (int i = 0; i < 29; ++i)
            r.engine->tick();
        auto mid = r.engine->get_state();
        assert(mid.status == MatchStatus::fighting);
        assert(near(mid.time_remaining, 1.f / 30.f, 1e-4f));
        r.engine->tick();
        auto s = r.engine->get_state();
        assert(s.status == MatchStatus::finished);
        assert(s.tick_count == 30);
        assert(s.time_remaining == 0.f);
        assert(!s.winner);

        auto r2 = make_rig(
            bot("A", "if (tick == 1) api.attack();"), bot("B", "api.stop();"), {100.f, 300.f}, {150.f, 300.f}, cfg);
        r2.engine->start_immediate();
        while (r2.engine->status() != MatchStatus::finished)
            r2.engine->tick();
        assert(r2.engine->get_state().winner == std::optional<std::string>("bot-1"));
    }
    // Faulty behaviors lose their turn but never stop the match.
    {
        auto &rt = metrics::runtime();
        auto errors_before = rt.behavior_runtime_errors.load();
        game::MatchConfig cfg;
        cfg.match_duration_sec = 2.f;
        auto r = make_rig(
            bot("A", "api.moveToward({x: 400, y: 300}); throw 'nope';"),
            bot("B", "api.attack(); while (true) {}"),
            {100.f, 300.f},
            {150.f, 300.f},
            cfg);
        r.engine->start_immediate();
        for (int i = 0; i < 5; ++i)
            r.engine->tick();
        auto s = r.engine->get_state();
        assert(s.tick_count == 5);
        assert(s.status == MatchStatus::fighting);
        assert(near(s.bots[0].velocity.x, 0.f)); // intents recorded before the throw are discarded
        assert(s.bots[0].health == 100.f); // the looping bot's attack is discarded too
        assert(rt.behavior_runtime_errors.load() >= errors_before + 10);

        // Both keep failing every tick and the clock still runs out.
        uint64_t guard = 0;
        while (r.engine->status() != MatchStatus::finished && ++guard < 1000)
            r.engine->tick();
        s = r.engine->get_state();
        assert(s.status == MatchStatus::finished);
        assert(s.tick_count == cfg.total_ticks());
        assert(near(s.bots[0].position.x, 100.f) && near(s.bots[0].position.y, 300.f));
        assert(s.winner == game::resolve_winner(s.bots[0], s.bots[1]));
        assert(!s.winner); // untouched on both sides: draw
        assert(rt.behavior_runtime_errors.load() >= errors_before + 2 * cfg.total_ticks() - 2);

        // A throwing bot facing a working one loses on health at the timeout.
        auto r2 = make_rig(
            bot("A", "throw 'always';"), bot("B", "api.stop(); api.attack();"), {100.f, 300.f}, {150.f, 300.f}, cfg);
        r2.engine->start_immediate();
        guard = 0;
        while (r2.engine->status() != MatchStatus::finished && ++guard < 1000)
            r2.engine->tick();
        s = r2.engine->get_state();
        assert(s.tick_count == cfg.total_ticks());
        assert(s.bots[0].health < 100.f && s.bots[0].health > 0.f);
        assert(s.bots[1].health == 100.f);
        assert(s.winner == game::resolve_winner(s.bots[0], s.bots[1]));
        assert(s.winner == std::optional<std::string>("bot-2"));
    }
    // A weapon whose cooldown outlasts the match swings once; time expiry settles it on health.
    {
        struct DamageLog : game::MatchObserver
        {
            void on_update(const game::GameState &s) override
            {
                for (const auto &ev : s.damage_events)
                    events.push_back(ev);
            }
            std::vector<game::DamageEvent> events;
        };
        game::MatchConfig cfg;
        cfg.match_duration_sec = 2.f;
        auto slow = with(bot("A", "api.stop(); api.attack();"), [&](game::BotDefinition &d) {
            d.weapon.cooldown_ms = cfg.match_duration_sec * 1000.f + 1000.f;
        });
        auto r = make_rig(slow, bot("B", "api.stop(); api.attack();"), {100.f, 300.f}, {150.f, 300.f}, cfg);
        auto log = std::make_shared<DamageLog>();
        r.engine->on_update(log);
        r.engine->start_immediate();
        uint64_t guard = 0;
        while (r.engine->status() != MatchStatus::finished && ++guard < 1000)
            r.engine->tick();

        size_t from_first = 0;
        size_t from_second = 0;
        for (const auto &ev : log->events) {
            if (ev.attacker_id == "bot-1") {
                ++from_first;
                assert(ev.tick == 1);
            } else {
                ++from_second;
            }
        }
        assert(from_first == 1);
        assert(from_second >= 2);

        auto s = r.engine->get_state();
        assert(s.status == MatchStatus::finished);
        assert(s.tick_count == cfg.total_ticks());
        assert(s.bots[0].health > 0.f && s.bots[1].health > 0.f);
        assert(s.bots[0].health < s.bots[1].health);
        assert(s.winner == game::resolve_winner(s.bots[0], s.bots[1]));
        assert(s.winner == std::optional<std::string>("bot-2"));
    }
    // A behavior that does not compile idles for the whole match.
    {
        auto r = make_rig(bot("A", "api.attack("), bot("B", "api.stop();"), {100.f, 300.f}, {150.f, 300.f});
        assert(r.engine->behavior_error(0).rfind("Compilation error:", 0) == 0);
        assert(r.engine->behavior_error(1).empty());
        r.engine->start_immediate();
        r.engine->tick();
        assert(r.engine->get_state().bots[1].health == 100.f);
    }
    // get_state() returns independent, stable copies.
    {
        auto r = make_rig(bot("A", "api.attack();"), bot("B", "api.stop();"), {100.f, 300.f}, {150.f, 300.f});
        r.engine->start_immediate();
        r.engine->tick();
        auto s1 = r.engine->get_state();
        auto s2 = r.engine->get_state();
        assert(s1 == s2);
        s1.bots[1].health = -5.f;
        s1.damage_events.clear();
        assert(r.engine->get_state() == s2);
    }
    // Same seed, same inputs: identical matches, including script randomness.
    {
        auto a = bot("A", "api.moveToward({x: Math.random() * 800, y: api.random(0, 600)});");
        auto b = bot("B", "api.strafe(Math.random() < 0.5 ? 'left' : 'right'); api.attack();");
        game::MatchConfig cfg;
        cfg.seed = 77;
        auto r1 = make_rig(a, b, {100.f, 300.f}, {400.f, 300.f}, cfg);
        auto r2 = make_rig(a, b, {100.f, 300.f}, {400.f, 300.f}, cfg);
        r1.engine->start_immediate();
        r2.engine->start_immediate();
        for (int i = 0; i < 60; ++i) {
            r1.engine->tick();
            r2.engine->tick();
        }
        assert(r1.engine->get_state() == r2.engine->get_state());
    }
    // Lifecycle guards and collision diagnostics.
    {
        auto r = make_rig(bot("A", "api.stop();"), bot("B", "api.stop();"), {100.f, 300.f}, {400.f, 300.f});
        r.engine->start_immediate();
        r.engine->start_immediate(); // ignored
        r.engine->tick();
        assert(r.engine->get_state().tick_count == 1);
        auto &rt = metrics::runtime();
        auto before = rt.collisions_total.load();
        auto s = r.engine->get_state();
        r.world->fire_collision(s.bots[0].body, s.bots[1].body);
        assert(rt.collisions_total.load() == before + 1);
        r.engine->stop(); // no loop running; harmless
        assert(!r.engine->loop_running());
        assert(r.engine->status() == MatchStatus::fighting);
    }
    // Invalid configuration is rejected up front.
    {
        game::MatchConfig cfg;
        cfg.tick_rate = 0;
        bool threw = false;
        try {
            make_rig(bot("A", ""), bot("B", ""), {100.f, 300.f}, {400.f, 300.f}, cfg);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "unit_match_rules OK" << std::endl;
    return 0;
}
