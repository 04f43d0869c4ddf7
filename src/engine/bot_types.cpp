// SPDX-License-Identifier: Apache-2.0
#include "engine/bot_types.hpp"

#include <cmath>

namespace duel::game {

const char *to_string(MatchStatus s)
{
    switch (s) {
        case MatchStatus::waiting:
            return "waiting";
        case MatchStatus::countdown:
            return "countdown";
        case MatchStatus::fighting:
            return "fighting";
        case MatchStatus::finished:
            return "finished";
    }
    return "unknown";
}

const char *to_string(WeaponType t)
{
    switch (t) {
        case WeaponType::spinner:
            return "spinner";
        case WeaponType::flipper:
            return "flipper";
        case WeaponType::hammer:
            return "hammer";
        case WeaponType::saw:
            return "saw";
        case WeaponType::lance:
            return "lance";
        case WeaponType::flamethrower:
            return "flamethrower";
    }
    return "spinner";
}

std::optional<WeaponType> parse_weapon_type(std::string_view name)
{
    if (name == "spinner")
        return WeaponType::spinner;
    if (name == "flipper")
        return WeaponType::flipper;
    if (name == "hammer")
        return WeaponType::hammer;
    if (name == "saw")
        return WeaponType::saw;
    if (name == "lance")
        return WeaponType::lance;
    if (name == "flamethrower")
        return WeaponType::flamethrower;
    return std::nullopt;
}

float radius_for_size(float size)
{
    static constexpr float kRadii[] = {15.f, 20.f, 25.f, 30.f, 35.f};
    float rounded = std::round(size);
    if (!(rounded >= 1.f && rounded <= 5.f))
        return 25.f;
    return kRadii[static_cast<int>(rounded) - 1];
}

} // namespace duel::game
