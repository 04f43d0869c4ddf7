// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/behavior_api.hpp"

#include "engine/sandbox/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace duel::sandbox {

namespace {

Value vec_value(Vec2 v)
{
    return make_object({{"x", Value(v.x)}, {"y", Value(v.y)}});
}

Value arg(std::span<const Value> args, size_t i)
{
    return i < args.size() ? args[i] : Value();
}

double number_arg(std::span<const Value> args, size_t i, const char *fn)
{
    Value v = arg(args, i);
    if (!v.is_number())
        throw RuntimeError(std::string(fn) + ": argument " + std::to_string(i + 1) + " must be a number", 0, 0);
    return v.as_number();
}

Vec2 vec_arg(std::span<const Value> args, size_t i, const char *fn)
{
    Value v = arg(args, i);
    if (v.is_object()) {
        const auto &fields = v.as_object()->fields;
        auto x = fields.find("x");
        auto y = fields.find("y");
        if (x != fields.end() && y != fields.end() && x->second.is_number() && y->second.is_number())
            return {static_cast<float>(x->second.as_number()), static_cast<float>(y->second.as_number())};
    }
    throw RuntimeError(std::string(fn) + ": expected a position {x, y}", 0, 0);
}

std::optional<float> optional_speed(std::span<const Value> args, size_t i, const char *fn)
{
    Value v = arg(args, i);
    if (v.is_undefined())
        return std::nullopt;
    if (!v.is_number())
        throw RuntimeError(std::string(fn) + ": speed must be a number", 0, 0);
    return static_cast<float>(v.as_number());
}

// Unary Math helper, NaN for missing or non-numeric input as in scripts written against JS.
Value math1(std::span<const Value> args, double (*f)(double))
{
    return Value(f(arg(args, 0).to_number()));
}

} // namespace

BehaviorApi::BehaviorApi(
    const game::BotState &self,
    const game::BotState &enemy,
    float arena_width,
    float arena_height,
    std::mt19937 &rng)
    : m_self(self), m_enemy(enemy), m_arena_width(arena_width), m_arena_height(arena_height), m_rng(rng)
{
}

float BehaviorApi::distance_to_enemy() const
{
    return distance_to(m_enemy.position);
}

void BehaviorApi::move_toward(Vec2 target, std::optional<float> speed)
{
    m_actions.move_target = target;
    m_actions.move_away = false;
    if (speed)
        m_actions.move_speed = speed;
}

void BehaviorApi::move_away(Vec2 target, std::optional<float> speed)
{
    m_actions.move_target = target;
    m_actions.move_away = true;
    if (speed)
        m_actions.move_speed = speed;
}

void BehaviorApi::rotate_to(float angle)
{
    m_actions.rotate_target = angle;
}

void BehaviorApi::attack()
{
    m_actions.attack = true;
}

void BehaviorApi::strafe(game::StrafeDirection dir)
{
    m_actions.strafe = dir;
}

void BehaviorApi::stop()
{
    m_actions.stop = true;
}

float BehaviorApi::angle_to(Vec2 point) const
{
    return std::atan2(point.y - m_self.position.y, point.x - m_self.position.x);
}

float BehaviorApi::distance_to(Vec2 point) const
{
    return std::hypot(point.x - m_self.position.x, point.y - m_self.position.y);
}

float BehaviorApi::random(float min, float max)
{
    std::uniform_real_distribution<float> unit(0.f, 1.f);
    return min + unit(m_rng) * (max - min);
}

Value BehaviorApi::script_object()
{
    using Args = std::span<const Value>;
    return make_object(
        {
            {"getMyPosition", make_native("getMyPosition", [this](Args) { return vec_value(my_position()); })},
            {"getMyAngle", make_native("getMyAngle", [this](Args) { return Value(my_angle()); })},
            {"getMyHealth", make_native("getMyHealth", [this](Args) { return Value(my_health()); })},
            {"getMyVelocity", make_native("getMyVelocity", [this](Args) { return vec_value(my_velocity()); })},
            {"getEnemyPosition", make_native("getEnemyPosition", [this](Args) { return vec_value(enemy_position()); })},
            {"getEnemyHealth", make_native("getEnemyHealth", [this](Args) { return Value(enemy_health()); })},
            {"getDistanceToEnemy",
             make_native("getDistanceToEnemy", [this](Args) { return Value(distance_to_enemy()); })},
            {"getArenaSize",
             make_native(
                 "getArenaSize",
                 [this](Args) {
                     return make_object({{"width", Value(m_arena_width)}, {"height", Value(m_arena_height)}});
                 })},
            {"moveToward",
             make_native(
                 "moveToward",
                 [this](Args a) {
                     move_toward(vec_arg(a, 0, "moveToward"), optional_speed(a, 1, "moveToward"));
                     return Value();
                 })},
            {"moveAway",
             make_native(
                 "moveAway",
                 [this](Args a) {
                     move_away(vec_arg(a, 0, "moveAway"), optional_speed(a, 1, "moveAway"));
                     return Value();
                 })},
            {"rotateTo",
             make_native(
                 "rotateTo",
                 [this](Args a) {
                     rotate_to(static_cast<float>(number_arg(a, 0, "rotateTo")));
                     return Value();
                 })},
            {"attack",
             make_native(
                 "attack",
                 [this](Args) {
                     attack();
                     return Value();
                 })},
            {"strafe",
             make_native(
                 "strafe",
                 [this](Args a) {
                     Value dir = arg(a, 0);
                     if (dir.is_string() && dir.as_string() == "left")
                         strafe(game::StrafeDirection::left);
                     else if (dir.is_string() && dir.as_string() == "right")
                         strafe(game::StrafeDirection::right);
                     else
                         throw RuntimeError("strafe: direction must be \"left\" or \"right\"", 0, 0);
                     return Value();
                 })},
            {"stop",
             make_native(
                 "stop",
                 [this](Args) {
                     stop();
                     return Value();
                 })},
            {"angleTo",
             make_native("angleTo", [this](Args a) { return Value(angle_to(vec_arg(a, 0, "angleTo"))); })},
            {"distanceTo",
             make_native("distanceTo", [this](Args a) { return Value(distance_to(vec_arg(a, 0, "distanceTo"))); })},
            {"random",
             make_native(
                 "random",
                 [this](Args a) {
                     float lo = static_cast<float>(number_arg(a, 0, "random"));
                     float hi = static_cast<float>(number_arg(a, 1, "random"));
                     return Value(random(lo, hi));
                 })},
        },
        true);
}

Value BehaviorApi::math_object()
{
    using Args = std::span<const Value>;
    auto minmax = [](Args a, bool want_max) {
        double best = want_max ? -INFINITY : INFINITY;
        for (const Value &v : a) {
            double d = v.to_number();
            if (std::isnan(d))
                return Value(d);
            best = want_max ? std::max(best, d) : std::min(best, d);
        }
        return Value(best);
    };
    return make_object(
        {
            {"PI", Value(std::numbers::pi)},
            {"E", Value(M_E)},
            {"abs", make_native("abs", [](Args a) { return math1(a, [](double x) { return std::fabs(x); }); })},
            {"sqrt", make_native("sqrt", [](Args a) { return math1(a, [](double x) { return std::sqrt(x); }); })},
            {"sin", make_native("sin", [](Args a) { return math1(a, [](double x) { return std::sin(x); }); })},
            {"cos", make_native("cos", [](Args a) { return math1(a, [](double x) { return std::cos(x); }); })},
            {"tan", make_native("tan", [](Args a) { return math1(a, [](double x) { return std::tan(x); }); })},
            {"atan", make_native("atan", [](Args a) { return math1(a, [](double x) { return std::atan(x); }); })},
            {"floor", make_native("floor", [](Args a) { return math1(a, [](double x) { return std::floor(x); }); })},
            {"ceil", make_native("ceil", [](Args a) { return math1(a, [](double x) { return std::ceil(x); }); })},
            {"round",
             make_native("round", [](Args a) { return math1(a, [](double x) { return std::floor(x + 0.5); }); })},
            {"sign",
             make_native(
                 "sign",
                 [](Args a) {
                     return math1(a, [](double x) { return std::isnan(x) ? x : (x > 0) - (x < 0) + 0.0; });
                 })},
            {"pow",
             make_native(
                 "pow", [](Args a) { return Value(std::pow(arg(a, 0).to_number(), arg(a, 1).to_number())); })},
            {"atan2",
             make_native(
                 "atan2", [](Args a) { return Value(std::atan2(arg(a, 0).to_number(), arg(a, 1).to_number())); })},
            {"hypot",
             make_native(
                 "hypot", [](Args a) { return Value(std::hypot(arg(a, 0).to_number(), arg(a, 1).to_number())); })},
            {"min", make_native("min", [minmax](Args a) { return minmax(a, false); })},
            {"max", make_native("max", [minmax](Args a) { return minmax(a, true); })},
            {"random", make_native("random", [this](Args) { return Value(random(0.f, 1.f)); })},
        },
        true);
}

} // namespace duel::sandbox
