// SPDX-License-Identifier: Apache-2.0
// box2d_world.hpp - PhysicsWorld backed by Box2D v3
#pragma once
#include "engine/physics.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace duel::phys {

// Owns one Box2D world with zero gravity (top-down arena). Arena units are converted to
// metres by a fixed scale so typical bot bodies (15-35 units) land in Box2D's preferred
// 0.1-10 m range.
class Box2dWorld final : public PhysicsWorld
{
public:
    explicit Box2dWorld(float units_per_meter = 30.f, int sub_steps = 4);
    ~Box2dWorld() override;

    Box2dWorld(const Box2dWorld &) = delete;
    Box2dWorld &operator=(const Box2dWorld &) = delete;

    void step(float dt) override;
    void destroy() override;

    BodyHandle create_body(const BodyConfig &config) override;
    void remove_body(BodyHandle h) override;

    Vec2 get_position(BodyHandle h) const override;
    void set_position(BodyHandle h, Vec2 pos) override;
    float get_angle(BodyHandle h) const override;
    void set_angle(BodyHandle h, float angle) override;
    Vec2 get_velocity(BodyHandle h) const override;
    void set_velocity(BodyHandle h, Vec2 vel) override;

    void apply_force(BodyHandle h, Vec2 force) override;
    void apply_impulse(BodyHandle h, Vec2 impulse) override;
    float get_mass(BodyHandle h) const override;

    void on_collision_start(CollisionCallback cb) override;

    BodyHandle create_static_rect(float cx, float cy, float width, float height) override;

    size_t body_count() const
    {
        return m_by_native.size();
    }

    bool alive() const
    {
        return B2_IS_NON_NULL(m_world);
    }

private:
    struct Slot
    {
        b2BodyId body{b2_nullBodyId};
        uint32_t generation{0};
        bool live{false};
    };

    b2BodyId lookup(BodyHandle h) const;
    BodyHandle insert(b2BodyId body);
    b2ShapeDef make_shape_def(const BodyConfig &config) const;
    void dispatch_contacts();

    b2Vec2 to_meters(Vec2 v) const
    {
        return {v.x / m_units_per_meter, v.y / m_units_per_meter};
    }

    Vec2 to_units(b2Vec2 v) const
    {
        return {v.x * m_units_per_meter, v.y * m_units_per_meter};
    }

    b2WorldId m_world{b2_nullWorldId};
    float m_units_per_meter;
    int m_sub_steps;
    std::vector<Slot> m_slots;
    std::vector<uint32_t> m_free_slots;
    std::unordered_map<int32_t, BodyHandle> m_by_native; // b2BodyId::index1 -> handle
    std::vector<CollisionCallback> m_callbacks;
};

} // namespace duel::phys
