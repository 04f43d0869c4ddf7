// SPDX-License-Identifier: Apache-2.0
#include "engine/physics.hpp"

namespace duel::phys {

const char *to_string(BodyShape s)
{
    switch (s) {
        case BodyShape::circle:
            return "circle";
        case BodyShape::rectangle:
            return "rectangle";
        case BodyShape::triangle:
            return "triangle";
        case BodyShape::pentagon:
            return "pentagon";
        case BodyShape::hexagon:
            return "hexagon";
    }
    return "circle";
}

std::optional<BodyShape> parse_body_shape(std::string_view name)
{
    if (name == "circle")
        return BodyShape::circle;
    if (name == "rectangle")
        return BodyShape::rectangle;
    if (name == "triangle")
        return BodyShape::triangle;
    if (name == "pentagon")
        return BodyShape::pentagon;
    if (name == "hexagon")
        return BodyShape::hexagon;
    return std::nullopt;
}

std::string to_string(BodyHandle h)
{
    if (!h.valid())
        return "body#null";
    return "body#" + std::to_string(h.index) + "v" + std::to_string(h.generation);
}

} // namespace duel::phys
