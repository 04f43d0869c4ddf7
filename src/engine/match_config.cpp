// SPDX-License-Identifier: Apache-2.0
#include "engine/match_config.hpp"

#include "common/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace duel::game {

namespace {

void apply_overrides(MatchConfig &cfg, const YAML::Node &root)
{
    if (!root || root.IsNull())
        return;
    if (!root.IsMap())
        throw std::runtime_error("match config must be a YAML mapping");
    if (root["arena_width"])
        cfg.arena_width = root["arena_width"].as<float>();
    if (root["arena_height"])
        cfg.arena_height = root["arena_height"].as<float>();
    if (root["wall_thickness"])
        cfg.wall_thickness = root["wall_thickness"].as<float>();
    if (root["spawn_inset"])
        cfg.spawn_inset = root["spawn_inset"].as<float>();
    if (root["match_duration_sec"])
        cfg.match_duration_sec = root["match_duration_sec"].as<float>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["countdown_ms"])
        cfg.countdown_ms = root["countdown_ms"].as<uint32_t>();
    if (root["base_health"])
        cfg.base_health = root["base_health"].as<float>();
    if (root["max_move_speed"])
        cfg.max_move_speed = root["max_move_speed"].as<float>();
    if (root["move_speed_scale"])
        cfg.move_speed_scale = root["move_speed_scale"].as<float>();
    if (root["strafe_factor"])
        cfg.strafe_factor = root["strafe_factor"].as<float>();
    if (root["attack_range_tolerance"])
        cfg.attack_range_tolerance = root["attack_range_tolerance"].as<float>();
    if (root["armor_damage_reduction"])
        cfg.armor_damage_reduction = root["armor_damage_reduction"].as<float>();
    if (root["knockback_per_damage"])
        cfg.knockback_per_damage = root["knockback_per_damage"].as<float>();
    if (root["attack_animation_frames"])
        cfg.attack_animation_frames = root["attack_animation_frames"].as<uint32_t>();
    if (root["behavior_step_budget"])
        cfg.behavior_step_budget = root["behavior_step_budget"].as<uint64_t>();
    if (root["seed"])
        cfg.seed = root["seed"].as<uint64_t>();
    if (root["bot_density"])
        cfg.bot_density = root["bot_density"].as<float>();
    if (root["armor_density_factor"])
        cfg.armor_density_factor = root["armor_density_factor"].as<float>();
    if (root["bot_friction"])
        cfg.bot_friction = root["bot_friction"].as<float>();
    if (root["bot_air_friction"])
        cfg.bot_air_friction = root["bot_air_friction"].as<float>();
    if (root["bot_restitution"])
        cfg.bot_restitution = root["bot_restitution"].as<float>();
    if (root["units_per_meter"])
        cfg.units_per_meter = root["units_per_meter"].as<float>();
    if (root["physics_sub_steps"])
        cfg.physics_sub_steps = root["physics_sub_steps"].as<int>();
    if (root["log_level"])
        log::set_level(root["log_level"].as<std::string>());
    if (root["log_json"])
        log::set_json(root["log_json"].as<bool>());
}

std::string trim(std::string s)
{
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

bool is_hex_color(const std::string &s)
{
    if (s.size() != 7 || s[0] != '#')
        return false;
    return std::all_of(s.begin() + 1, s.end(), [](unsigned char c) { return std::isxdigit(c); });
}

YAML::Node require(const YAML::Node &parent, const char *key, const char *where)
{
    YAML::Node n = parent[key];
    if (!n || n.IsNull())
        throw std::runtime_error(std::string(where) + ": missing required field '" + key + "'");
    return n;
}

float require_number(const YAML::Node &parent, const char *key, const char *where)
{
    float v = require(parent, key, where).as<float>();
    if (std::isnan(v))
        throw std::runtime_error(std::string(where) + ": field '" + key + "' is not a number");
    return v;
}

std::shared_ptr<const BotDefinition> bot_from_node(const YAML::Node &root, const std::string &where_s)
{
    const char *where = where_s.c_str();
    if (!root.IsMap())
        throw std::runtime_error(where_s + ": bot definition must be a YAML mapping");
    BotDefinition def;
    def.name = trim(require(root, "name", where).as<std::string>());
    if (def.name.empty())
        throw std::runtime_error(where_s + ": 'name' must be a non-empty string");

    std::string shape = require(root, "shape", where).as<std::string>();
    auto parsed_shape = phys::parse_body_shape(shape);
    if (!parsed_shape)
        throw std::runtime_error(
            where_s + ": 'shape' must be one of circle, rectangle, triangle, pentagon, hexagon (got '" + shape + "')");
    def.shape = *parsed_shape;

    def.color = require(root, "color", where).as<std::string>();
    if (!is_hex_color(def.color))
        throw std::runtime_error(where_s + ": 'color' must look like #RRGGBB (got '" + def.color + "')");

    def.size = require_number(root, "size", where);
    def.speed = require_number(root, "speed", where);
    def.armor = require_number(root, "armor", where);

    YAML::Node weapon = require(root, "weapon", where);
    if (!weapon.IsMap())
        throw std::runtime_error(where_s + ": 'weapon' must be a mapping with type, damage, cooldown and range");
    std::string wtype = require(weapon, "type", where).as<std::string>();
    auto parsed_weapon = parse_weapon_type(wtype);
    if (!parsed_weapon)
        throw std::runtime_error(where_s + ": unknown weapon type '" + wtype + "'");
    def.weapon.type = *parsed_weapon;
    def.weapon.damage = require_number(weapon, "damage", where);
    def.weapon.cooldown_ms = require_number(weapon, "cooldown", where);
    def.weapon.range = require_number(weapon, "range", where);

    def.behavior_code = require(root, "behavior_code", where).as<std::string>();
    if (trim(def.behavior_code).empty())
        throw std::runtime_error(where_s + ": 'behavior_code' must not be empty");
    if (root["strategy_description"])
        def.strategy_description = root["strategy_description"].as<std::string>();

    return std::make_shared<const BotDefinition>(clamp_bot_definition(std::move(def)));
}

} // namespace

uint64_t MatchConfig::total_ticks() const
{
    return static_cast<uint64_t>(std::llround(static_cast<double>(match_duration_sec) * tick_rate));
}

void validate_match_config(const MatchConfig &cfg)
{
    if (cfg.tick_rate == 0 || cfg.tick_rate > 1000)
        throw std::runtime_error("tick_rate must be in 1..1000");
    if (!(cfg.arena_width > 0.f) || !(cfg.arena_height > 0.f))
        throw std::runtime_error("arena dimensions must be positive");
    if (!(cfg.match_duration_sec > 0.f))
        throw std::runtime_error("match_duration_sec must be positive");
    if (!(cfg.base_health > 0.f))
        throw std::runtime_error("base_health must be positive");
    if (!(cfg.units_per_meter > 0.f))
        throw std::runtime_error("units_per_meter must be positive");
    if (cfg.behavior_step_budget == 0)
        throw std::runtime_error("behavior_step_budget must be positive");
    if (cfg.spawn_inset * 2.f >= cfg.arena_width)
        throw std::runtime_error("spawn_inset leaves no room between the spawn points");
}

MatchConfig load_match_config(const std::string &path)
{
    MatchConfig cfg;
    apply_match_config_overrides(cfg, path);
    return cfg;
}

void apply_match_config_overrides(MatchConfig &cfg, const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    apply_overrides(cfg, root);
    validate_match_config(cfg);
    log::debug(
        "[config] loaded {} arena={}x{} duration={}s tick_rate={} seed={}",
        path,
        cfg.arena_width,
        cfg.arena_height,
        cfg.match_duration_sec,
        cfg.tick_rate,
        cfg.seed);
}

BotDefinition clamp_bot_definition(BotDefinition def)
{
    def.name = trim(std::move(def.name));
    if (def.name.size() > 30)
        def.name.resize(30);
    def.size = std::clamp(def.size, 1.f, 5.f);
    def.speed = std::clamp(def.speed, 1.f, 10.f);
    def.armor = std::clamp(def.armor, 1.f, 10.f);
    def.weapon.damage = std::clamp(def.weapon.damage, 1.f, 10.f);
    def.weapon.cooldown_ms = std::clamp(def.weapon.cooldown_ms, 200.f, 2000.f);
    def.weapon.range = std::clamp(def.weapon.range, 20.f, 120.f);
    for (char &c : def.color)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (def.strategy_description.empty())
        def.strategy_description = "No strategy description provided.";
    return def;
}

std::shared_ptr<const BotDefinition> load_bot_definition(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    auto def = bot_from_node(root, path);
    log::debug("[config] bot '{}' loaded from {}", def->name, path);
    return def;
}

std::shared_ptr<const BotDefinition> parse_bot_definition(const std::string &yaml_text)
{
    return bot_from_node(YAML::Load(yaml_text), "<inline bot>");
}

} // namespace duel::game
