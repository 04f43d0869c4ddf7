// SPDX-License-Identifier: Apache-2.0
// Box2D adapter: unit conversion, handle lifecycle, impulses, walls and contact events.
#include "engine/box2d_world.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <numbers>

using namespace duel::phys;

static bool near(float a, float b, float eps)
{
    return std::fabs(a - b) <= eps;
}

static BodyConfig circle_at(float x, float y, float radius = 20.f)
{
    BodyConfig c;
    c.shape = BodyShape::circle;
    c.position = {x, y};
    c.radius = radius;
    c.density = 0.01f;
    c.air_friction = 0.f;
    c.friction = 0.f;
    c.restitution = 0.f;
    return c;
}

int main()
{
    // Positions and angles round-trip through the metre conversion.
    {
        Box2dWorld world(30.f, 4);
        auto h = world.create_body(circle_at(120.f, 90.f));
        assert(h.valid());
        Vec2 p = world.get_position(h);
        assert(near(p.x, 120.f, 1e-3f) && near(p.y, 90.f, 1e-3f));
        world.set_position(h, {300.f, 200.f});
        p = world.get_position(h);
        assert(near(p.x, 300.f, 1e-3f) && near(p.y, 200.f, 1e-3f));
        world.set_angle(h, 1.2f);
        assert(near(world.get_angle(h), 1.2f, 1e-4f));
        world.set_velocity(h, {60.f, -30.f});
        Vec2 v = world.get_velocity(h);
        assert(near(v.x, 60.f, 1e-3f) && near(v.y, -30.f, 1e-3f));
    }
    // Mass is density * area in arena units; an impulse changes velocity by impulse / mass.
    {
        Box2dWorld world(30.f, 4);
        auto h = world.create_body(circle_at(100.f, 100.f, 20.f));
        float mass = world.get_mass(h);
        float expected = 0.01f * std::numbers::pi_v<float> * 20.f * 20.f;
        assert(near(mass, expected, expected * 0.01f));
        world.apply_impulse(h, {mass * 50.f, 0.f});
        Vec2 v = world.get_velocity(h);
        assert(near(v.x, 50.f, 0.5f));
        assert(near(v.y, 0.f, 1e-3f));
        // Free flight with zero damping: roughly 50 units in one second.
        for (int i = 0; i < 30; ++i)
            world.step(1.f / 30.f);
        Vec2 p = world.get_position(h);
        assert(near(p.x, 150.f, 2.f));
    }
    // A force acts for one step only: dv = force / mass * dt.
    {
        Box2dWorld world(30.f, 4);
        auto h = world.create_body(circle_at(100.f, 100.f, 20.f));
        float mass = world.get_mass(h);
        world.apply_force(h, {0.f, mass * 300.f});
        world.step(1.f / 30.f);
        assert(near(world.get_velocity(h).y, 10.f, 0.2f));
        world.step(1.f / 30.f);
        assert(near(world.get_velocity(h).y, 10.f, 0.2f));
    }
    // Every shape builds a body with positive mass.
    {
        Box2dWorld world;
        for (BodyShape s :
             {BodyShape::circle, BodyShape::rectangle, BodyShape::triangle, BodyShape::pentagon, BodyShape::hexagon}) {
            BodyConfig c = circle_at(200.f, 200.f, 25.f);
            c.shape = s;
            auto h = world.create_body(c);
            assert(world.get_mass(h) > 0.f);
        }
        assert(world.body_count() == 5);
    }
    // Handles are generational: a removed body's handle never resolves again.
    {
        Box2dWorld world;
        auto a = world.create_body(circle_at(50.f, 50.f));
        world.remove_body(a);
        auto b = world.create_body(circle_at(60.f, 60.f));
        assert(b.index == a.index);
        assert(b.generation != a.generation);
        bool threw = false;
        try {
            (void)world.get_position(a);
        } catch (const BodyNotFound &) {
            threw = true;
        }
        assert(threw);
        threw = false;
        try {
            world.set_velocity(BodyHandle{}, {1.f, 1.f});
        } catch (const BodyNotFound &) {
            threw = true;
        }
        assert(threw);
        Vec2 p = world.get_position(b);
        assert(near(p.x, 60.f, 1e-3f));
    }
    // Static walls stop a body and raise collision-start callbacks with both handles.
    {
        Box2dWorld world(30.f, 4);
        auto wall = world.create_static_rect(400.f, 100.f, 40.f, 400.f);
        auto ball = world.create_body(circle_at(300.f, 100.f, 20.f));
        int contacts = 0;
        bool saw_pair = false;
        world.on_collision_start([&](const CollisionInfo &info) {
            ++contacts;
            if ((info.body_a == wall && info.body_b == ball) || (info.body_a == ball && info.body_b == wall))
                saw_pair = true;
        });
        world.set_velocity(ball, {300.f, 0.f});
        for (int i = 0; i < 60; ++i)
            world.step(1.f / 30.f);
        assert(contacts >= 1);
        assert(saw_pair);
        // The wall's left face is at x=380; the ball never tunnels through.
        assert(world.get_position(ball).x < 380.f);
        Vec2 wp = world.get_position(wall);
        assert(near(wp.x, 400.f, 1e-3f) && near(wp.y, 100.f, 1e-3f));
    }
    // Air friction bleeds velocity.
    {
        Box2dWorld world;
        BodyConfig c = circle_at(100.f, 100.f);
        c.air_friction = 0.05f;
        auto h = world.create_body(c);
        world.set_velocity(h, {100.f, 0.f});
        for (int i = 0; i < 30; ++i)
            world.step(1.f / 30.f);
        assert(world.get_velocity(h).x < 100.f);
        assert(world.get_velocity(h).x > 0.f);
    }
    // destroy() is idempotent and leaves a dead world.
    {
        Box2dWorld world;
        world.create_body(circle_at(10.f, 10.f));
        world.destroy();
        world.destroy();
        assert(!world.alive());
        assert(world.body_count() == 0);
        world.step(1.f / 30.f);
    }
    std::cout << "unit_box2d_world OK" << std::endl;
    return 0;
}
