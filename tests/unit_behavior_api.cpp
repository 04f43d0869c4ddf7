// SPDX-License-Identifier: Apache-2.0
// BehaviorApi sensing/intents, both natively and through the script object.
#include "engine/sandbox/behavior_api.hpp"
#include "engine/sandbox/sandbox.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numbers>
#include <random>

using namespace duel;
using duel::sandbox::BehaviorApi;

static bool near(float a, float b, float eps = 1e-4f)
{
    return std::fabs(a - b) <= eps;
}

static game::BotState make_bot(const char *id, float x, float y, float hp)
{
    game::BotState b;
    b.id = id;
    b.position = {x, y};
    b.velocity = {1.f, -2.f};
    b.angle = 0.25f;
    b.health = hp;
    b.max_health = 100.f;
    return b;
}

int main()
{
    std::mt19937 rng(12345);
    auto self = make_bot("bot-1", 100.f, 100.f, 80.f);
    auto enemy = make_bot("bot-2", 130.f, 140.f, 55.f);

    // Native sensing reads the bound copies.
    {
        BehaviorApi api(self, enemy, 800.f, 600.f, rng);
        assert(api.my_position() == self.position);
        assert(api.enemy_position() == enemy.position);
        assert(near(api.my_health(), 80.f));
        assert(near(api.enemy_health(), 55.f));
        assert(near(api.distance_to_enemy(), 50.f));
        assert(near(api.angle_to({200.f, 100.f}), 0.f));
        assert(near(api.angle_to({100.f, 200.f}), std::numbers::pi_v<float> / 2.f));
        assert(near(api.distance_to({103.f, 104.f}), 5.f));
        assert(api.actions() == game::BotActions{});
        for (int i = 0; i < 100; ++i) {
            float r = api.random(-2.f, 3.f);
            assert(r >= -2.f && r <= 3.f);
        }
    }
    // Later intents overwrite earlier ones of the same kind; flags accumulate.
    {
        BehaviorApi api(self, enemy, 800.f, 600.f, rng);
        api.move_toward({10.f, 20.f}, 4.f);
        api.move_away({30.f, 40.f});
        api.rotate_to(1.5f);
        api.attack();
        api.strafe(game::StrafeDirection::left);
        api.strafe(game::StrafeDirection::right);
        const auto &a = api.actions();
        assert(a.move_target && *a.move_target == (game::Vec2{30.f, 40.f}));
        assert(a.move_away);
        assert(a.move_speed && near(*a.move_speed, 4.f));
        assert(a.rotate_target && near(*a.rotate_target, 1.5f));
        assert(a.attack);
        assert(a.strafe == game::StrafeDirection::right);
        assert(!a.stop);
        api.stop();
        assert(api.actions().stop);
    }
    // Script surface: the same calls from behavior code.
    {
        BehaviorApi api(self, enemy, 800.f, 600.f, rng);
        auto code = sandbox::compile_behavior(R"(
            const me = api.getMyPosition();
            const foe = api.getEnemyPosition();
            const size = api.getArenaSize();
            if (me.x !== 100 || foe.y !== 140) throw 'bad position';
            if (size.width !== 800 || size.height !== 600) throw 'bad arena';
            if (api.getMyHealth() !== 80 || api.getEnemyHealth() !== 55) throw 'bad health';
            if (Math.abs(api.getDistanceToEnemy() - 50) > 0.001) throw 'bad distance';
            const v = api.getMyVelocity();
            if (v.x !== 1 || v.y !== -2) throw 'bad velocity';
            if (Math.abs(api.getMyAngle() - 0.25) > 0.0001) throw 'bad angle';
            const r = api.random(5, 6);
            if (r < 5 || r > 6) throw 'bad random';
            const m = Math.random();
            if (m < 0 || m > 1) throw 'bad Math.random';
            if (Math.max(1, 7, 3) !== 7 || !(Math.min() > 1e308)) throw 'bad min/max';
            if (Math.sign(-4) !== -1 || Math.floor(2.7) !== 2 || Math.hypot(3, 4) !== 5) throw 'bad math';
            api.moveToward(foe, 3);
            api.rotateTo(api.angleTo(foe));
            api.strafe("left");
            api.attack();
        )");
        assert(code.ok());
        assert(sandbox::execute_behavior(code, api, 1));
        const auto &a = api.actions();
        assert(a.move_target && *a.move_target == enemy.position);
        assert(!a.move_away);
        assert(a.move_speed && near(*a.move_speed, 3.f));
        assert(a.rotate_target && near(*a.rotate_target, std::atan2(40.f, 30.f)));
        assert(a.strafe == game::StrafeDirection::left);
        assert(a.attack);
    }
    // Mutating a sensed position never reaches the engine's copy.
    {
        BehaviorApi api(self, enemy, 800.f, 600.f, rng);
        auto code = sandbox::compile_behavior("let p = api.getMyPosition(); p.x = 999; return;");
        assert(sandbox::execute_behavior(code, api, 1));
        assert(api.my_position() == self.position);
    }
    // Bad arguments are runtime errors.
    {
        for (const char *src : {
                 "api.moveToward(5);",
                 "api.moveToward({x: 1});",
                 "api.moveAway({x: 1, y: 2}, 'fast');",
                 "api.rotateTo('north');",
                 "api.strafe('up');",
                 "api.strafe();",
                 "api.distanceTo(null);",
                 "api.random(1);",
             }) {
            BehaviorApi api(self, enemy, 800.f, 600.f, rng);
            assert(!sandbox::execute_behavior(sandbox::compile_behavior(src), api, 1));
        }
    }
    // Math.random and api.random share the match generator: same seed, same sequence.
    {
        std::mt19937 r1(99), r2(99);
        BehaviorApi a1(self, enemy, 800.f, 600.f, r1);
        BehaviorApi a2(self, enemy, 800.f, 600.f, r2);
        auto code = sandbox::compile_behavior("api.rotateTo(Math.random() + api.random(0, 10));");
        assert(sandbox::execute_behavior(code, a1, 1));
        assert(sandbox::execute_behavior(code, a2, 1));
        assert(a1.actions().rotate_target == a2.actions().rotate_target);
    }
    std::cout << "unit_behavior_api OK" << std::endl;
    return 0;
}
