#pragma once

#include <string_view>

#include "types.hpp"

// Which end of the data deque an instruction works on.
// LEFT is the front (`!op`), RIGHT is the back (`op!`).
enum class Direction : u8 {
    LEFT,
    RIGHT,
};

constexpr Direction invert(Direction dir) {
    return dir == Direction::LEFT ? Direction::RIGHT : Direction::LEFT;
}

constexpr std::string_view direction_name(Direction dir) {
    return dir == Direction::LEFT ? "left" : "right";
}
