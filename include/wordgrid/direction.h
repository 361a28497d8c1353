#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace wordgrid {

// The eight straight reading directions.
// Enumerator order is the canonical iteration order used by solve() and by
// the report writer.
enum class Direction : std::uint8_t {
  LeftToRight = 0,
  RightToLeft = 1,
  Up = 2,
  Down = 3,
  DiagUpLeft = 4,
  DiagUpRight = 5,
  DiagDownLeft = 6,
  DiagDownRight = 7,
};

// One step along a direction, in (row, col) order.
struct Step {
  int d_row = 0;
  int d_col = 0;
};

inline constexpr std::array<Direction, 8> kAllDirections = {
    Direction::LeftToRight, Direction::RightToLeft, Direction::Up,          Direction::Down,
    Direction::DiagUpLeft,  Direction::DiagUpRight, Direction::DiagDownLeft, Direction::DiagDownRight,
};

Step step_of(Direction d) noexcept;

// Short code written to reports ("LR", "RL", "U", "D", "DUL", ...).
const char* direction_code(Direction d) noexcept;

// Human readable name ("left-to-right", "down-diagonal-left", ...).
const char* direction_name(Direction d) noexcept;

// Accepts either a code or a long name. Throws std::invalid_argument.
Direction parse_direction(const std::string& text);

} // namespace wordgrid
