// SPDX-License-Identifier: Apache-2.0
#include "engine/box2d_world.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace duel::phys {

namespace {

// Matter-style air friction removes a fraction f of velocity every 1/60 s. Box2D damping
// integrates v' = -c v, so the equivalent continuous rate is c = -ln(1 - f) * 60.
float damping_from_air_friction(float f)
{
    f = std::clamp(f, 0.f, 0.99f);
    return -std::log(1.f - f) * 60.f;
}

b2Polygon make_regular_polygon(int sides, float circumradius)
{
    // First vertex offset by half a sector so a triangle points along +x edge-first.
    const float theta = 2.f * std::numbers::pi_v<float> / static_cast<float>(sides);
    const float offset = theta * 0.5f;
    b2Vec2 pts[8];
    for (int i = 0; i < sides; ++i) {
        float a = offset + theta * static_cast<float>(i);
        pts[i] = {std::cos(a) * circumradius, std::sin(a) * circumradius};
    }
    b2Hull hull = b2ComputeHull(pts, sides);
    return b2MakePolygon(&hull, 0.0f);
}

} // namespace

Box2dWorld::Box2dWorld(float units_per_meter, int sub_steps)
    : m_units_per_meter(units_per_meter > 0.f ? units_per_meter : 30.f), m_sub_steps(std::max(1, sub_steps))
{
    b2WorldDef def = b2DefaultWorldDef();
    def.gravity = {0.0f, 0.0f}; // top-down arena
    m_world = b2CreateWorld(&def);
    log::debug("[phys] box2d world created units_per_meter={} sub_steps={}", m_units_per_meter, m_sub_steps);
}

Box2dWorld::~Box2dWorld()
{
    destroy();
}

void Box2dWorld::step(float dt)
{
    if (B2_IS_NULL(m_world) || dt <= 0.f)
        return;
    b2World_Step(m_world, dt, m_sub_steps);
    dispatch_contacts();
}

void Box2dWorld::destroy()
{
    m_callbacks.clear();
    m_by_native.clear();
    m_slots.clear();
    m_free_slots.clear();
    if (B2_IS_NON_NULL(m_world)) {
        b2DestroyWorld(m_world);
        m_world = b2_nullWorldId;
        log::debug("[phys] box2d world destroyed");
    }
}

b2ShapeDef Box2dWorld::make_shape_def(const BodyConfig &config) const
{
    b2ShapeDef sd = b2DefaultShapeDef();
    // density is per square arena unit; Box2D wants per square metre
    sd.density = config.density * m_units_per_meter * m_units_per_meter;
    sd.friction = config.friction;
    sd.restitution = config.restitution;
    sd.enableContactEvents = true;
    return sd;
}

BodyHandle Box2dWorld::create_body(const BodyConfig &config)
{
    if (B2_IS_NULL(m_world))
        throw std::logic_error("create_body on a destroyed physics world");
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = config.is_static ? b2_staticBody : b2_dynamicBody;
    bd.position = to_meters(config.position);
    bd.linearDamping = damping_from_air_friction(config.air_friction);
    bd.angularDamping = bd.linearDamping;
    b2BodyId body = b2CreateBody(m_world, &bd);

    b2ShapeDef sd = make_shape_def(config);
    const float r = config.radius / m_units_per_meter;
    switch (config.shape) {
        case BodyShape::rectangle: {
            b2Polygon box = b2MakeBox(r, r * 0.8f); // 2r x 1.6r
            b2CreatePolygonShape(body, &sd, &box);
            break;
        }
        case BodyShape::triangle: {
            b2Polygon poly = make_regular_polygon(3, r);
            b2CreatePolygonShape(body, &sd, &poly);
            break;
        }
        case BodyShape::pentagon: {
            b2Polygon poly = make_regular_polygon(5, r);
            b2CreatePolygonShape(body, &sd, &poly);
            break;
        }
        case BodyShape::hexagon: {
            b2Polygon poly = make_regular_polygon(6, r);
            b2CreatePolygonShape(body, &sd, &poly);
            break;
        }
        case BodyShape::circle:
        default: {
            b2Circle circle{{0.0f, 0.0f}, r};
            b2CreateCircleShape(body, &sd, &circle);
            break;
        }
    }
    BodyHandle h = insert(body);
    log::trace(
        "[phys] body created handle={} shape={} pos=({}, {}) radius={} mass={}",
        to_string(h),
        to_string(config.shape),
        config.position.x,
        config.position.y,
        config.radius,
        b2Body_GetMass(body));
    return h;
}

BodyHandle Box2dWorld::create_static_rect(float cx, float cy, float width, float height)
{
    if (B2_IS_NULL(m_world))
        throw std::logic_error("create_static_rect on a destroyed physics world");
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = b2_staticBody;
    bd.position = to_meters({cx, cy});
    b2BodyId body = b2CreateBody(m_world, &bd);
    b2ShapeDef sd = b2DefaultShapeDef();
    sd.density = 0.0f;
    sd.enableContactEvents = true;
    b2Polygon poly = b2MakeBox(width * 0.5f / m_units_per_meter, height * 0.5f / m_units_per_meter);
    b2CreatePolygonShape(body, &sd, &poly);
    return insert(body);
}

void Box2dWorld::remove_body(BodyHandle h)
{
    b2BodyId body = lookup(h);
    m_by_native.erase(body.index1);
    b2DestroyBody(body);
    Slot &slot = m_slots[h.index];
    slot.body = b2_nullBodyId;
    slot.live = false;
    ++slot.generation;
    m_free_slots.push_back(h.index);
}

Vec2 Box2dWorld::get_position(BodyHandle h) const
{
    return to_units(b2Body_GetPosition(lookup(h)));
}

void Box2dWorld::set_position(BodyHandle h, Vec2 pos)
{
    b2BodyId body = lookup(h);
    b2Body_SetTransform(body, to_meters(pos), b2Body_GetRotation(body));
}

float Box2dWorld::get_angle(BodyHandle h) const
{
    b2Rot q = b2Body_GetRotation(lookup(h));
    return std::atan2(q.s, q.c);
}

void Box2dWorld::set_angle(BodyHandle h, float angle)
{
    b2BodyId body = lookup(h);
    b2Body_SetTransform(body, b2Body_GetPosition(body), b2MakeRot(angle));
}

Vec2 Box2dWorld::get_velocity(BodyHandle h) const
{
    return to_units(b2Body_GetLinearVelocity(lookup(h)));
}

void Box2dWorld::set_velocity(BodyHandle h, Vec2 vel)
{
    b2Body_SetLinearVelocity(lookup(h), to_meters(vel));
}

void Box2dWorld::apply_force(BodyHandle h, Vec2 force)
{
    // mass * units/s^2 -> mass * m/s^2
    b2Body_ApplyForceToCenter(lookup(h), to_meters(force), true);
}

void Box2dWorld::apply_impulse(BodyHandle h, Vec2 impulse)
{
    // Native impulse: dv = impulse / mass exactly, expressed in metres.
    b2Body_ApplyLinearImpulseToCenter(lookup(h), to_meters(impulse), true);
}

float Box2dWorld::get_mass(BodyHandle h) const
{
    // density was scaled by units_per_meter^2 at creation, so kg == density * area in arena units
    return b2Body_GetMass(lookup(h));
}

void Box2dWorld::on_collision_start(CollisionCallback cb)
{
    m_callbacks.push_back(std::move(cb));
}

b2BodyId Box2dWorld::lookup(BodyHandle h) const
{
    if (h.index >= m_slots.size())
        throw BodyNotFound(h);
    const Slot &slot = m_slots[h.index];
    if (!slot.live || slot.generation != h.generation || !b2Body_IsValid(slot.body))
        throw BodyNotFound(h);
    return slot.body;
}

BodyHandle Box2dWorld::insert(b2BodyId body)
{
    uint32_t index;
    if (!m_free_slots.empty()) {
        index = m_free_slots.back();
        m_free_slots.pop_back();
    } else {
        index = static_cast<uint32_t>(m_slots.size());
        m_slots.push_back({});
    }
    Slot &slot = m_slots[index];
    slot.body = body;
    slot.live = true;
    BodyHandle h{index, slot.generation};
    m_by_native[body.index1] = h;
    return h;
}

void Box2dWorld::dispatch_contacts()
{
    b2ContactEvents events = b2World_GetContactEvents(m_world);
    if (events.beginCount <= 0 || m_callbacks.empty())
        return;
    // Callbacks may register further callbacks; iterate a stable copy.
    std::vector<CollisionCallback> callbacks = m_callbacks;
    for (int i = 0; i < events.beginCount; ++i) {
        const b2ContactBeginTouchEvent &ev = events.beginEvents[i];
        if (!b2Shape_IsValid(ev.shapeIdA) || !b2Shape_IsValid(ev.shapeIdB))
            continue;
        b2BodyId a = b2Shape_GetBody(ev.shapeIdA);
        b2BodyId b = b2Shape_GetBody(ev.shapeIdB);
        auto ita = m_by_native.find(a.index1);
        auto itb = m_by_native.find(b.index1);
        if (ita == m_by_native.end() || itb == m_by_native.end())
            continue;
        float deepest = 0.f;
        for (int p = 0; p < ev.manifold.pointCount; ++p)
            deepest = std::max(deepest, -ev.manifold.points[p].separation);
        CollisionInfo info;
        info.body_a = ita->second;
        info.body_b = itb->second;
        info.normal = {ev.manifold.normal.x, ev.manifold.normal.y}; // unit vector, scale-free
        info.depth = deepest * m_units_per_meter;
        for (auto &cb : callbacks)
            cb(info);
    }
}

} // namespace duel::phys
