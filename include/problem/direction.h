#pragma once

#include <string>

namespace problem {

/**
 * Link from a pixel to one of its 4-connected neighbours
 * NONE marks a segment root (the pixel links to nothing).
 */
enum class Direction {
    UP = 0,
    DOWN = 1,
    LEFT = 2,
    RIGHT = 3,
    NONE = 4
};

inline Direction opposite(Direction d) {
    switch (d) {
    case Direction::UP:    return Direction::DOWN;
    case Direction::DOWN:  return Direction::UP;
    case Direction::LEFT:  return Direction::RIGHT;
    case Direction::RIGHT: return Direction::LEFT;
    case Direction::NONE:  break;
    }
    return Direction::NONE;
}

inline std::string to_string(Direction d) {
    switch (d) {
    case Direction::UP:    return "UP";
    case Direction::DOWN:  return "DOWN";
    case Direction::LEFT:  return "LEFT";
    case Direction::RIGHT: return "RIGHT";
    case Direction::NONE:  break;
    }
    return "NONE";
}

} // namespace problem
