// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Backend-agnostic rigid-body world used by the match engine
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace duel::phys {

struct Vec2
{
    float x{0.f};
    float y{0.f};

    bool operator==(const Vec2 &) const = default;
};

enum class BodyShape
{
    circle,
    rectangle,
    triangle,
    pentagon,
    hexagon
};

const char *to_string(BodyShape s);
std::optional<BodyShape> parse_body_shape(std::string_view name);

// Generational key into the adapter's body arena. A removed body's slot is reused with a
// bumped generation, so a stale handle never aliases the new occupant.
struct BodyHandle
{
    uint32_t index{UINT32_MAX};
    uint32_t generation{0};

    bool valid() const noexcept
    {
        return index != UINT32_MAX;
    }

    bool operator==(const BodyHandle &) const = default;
};

std::string to_string(BodyHandle h);

struct BodyConfig
{
    BodyShape shape{BodyShape::circle};
    Vec2 position;
    float radius{25.f}; // circle radius / polygon circumradius / rectangle half-width
    float density{0.01f}; // mass per square arena unit
    float friction{0.1f};
    float air_friction{0.05f}; // fraction of velocity lost per 1/60 s
    float restitution{0.3f};
    bool is_static{false};
};

struct CollisionInfo
{
    BodyHandle body_a;
    BodyHandle body_b;
    Vec2 normal; // unit, from body_a towards body_b
    float depth{0.f}; // penetration, arena units
};

using CollisionCallback = std::function<void(const CollisionInfo &)>;

// Lookup of an unknown or stale handle. Indicates an engine bug, never bad input.
class BodyNotFound : public std::logic_error
{
public:
    explicit BodyNotFound(BodyHandle h) : std::logic_error("physics body not found: " + to_string(h)) {}
};

// Units: lengths in arena units, velocities in units/second, angles in radians,
// impulses in mass * units/second. Every handle-taking call throws BodyNotFound for
// a handle this world did not hand out (or already removed).
class PhysicsWorld
{
public:
    virtual ~PhysicsWorld() = default;

    virtual void step(float dt) = 0;
    virtual void destroy() = 0;

    virtual BodyHandle create_body(const BodyConfig &config) = 0;
    virtual void remove_body(BodyHandle h) = 0;

    virtual Vec2 get_position(BodyHandle h) const = 0;
    virtual void set_position(BodyHandle h, Vec2 pos) = 0;
    virtual float get_angle(BodyHandle h) const = 0;
    virtual void set_angle(BodyHandle h, float angle) = 0;
    virtual Vec2 get_velocity(BodyHandle h) const = 0;
    virtual void set_velocity(BodyHandle h, Vec2 vel) = 0;

    virtual void apply_force(BodyHandle h, Vec2 force) = 0;
    virtual void apply_impulse(BodyHandle h, Vec2 impulse) = 0;
    virtual float get_mass(BodyHandle h) const = 0;

    virtual void on_collision_start(CollisionCallback cb) = 0;

    // Immovable axis-aligned box centred on (cx, cy); used for arena walls.
    virtual BodyHandle create_static_rect(float cx, float cy, float width, float height) = 0;
};

} // namespace duel::phys
