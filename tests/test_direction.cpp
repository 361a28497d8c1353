#include <cassert>
#include <cstring>
#include <set>
#include <stdexcept>
#include <utility>

#include "wordgrid/direction.h"

int main() {
  using wordgrid::Direction;

  // Canonical order, as used by solve() and the report.
  assert(wordgrid::kAllDirections.front() == Direction::LeftToRight);
  assert(wordgrid::kAllDirections.back() == Direction::DiagDownRight);

  assert(std::strcmp(wordgrid::direction_code(Direction::LeftToRight), "LR") == 0);
  assert(std::strcmp(wordgrid::direction_code(Direction::DiagDownLeft), "DDL") == 0);
  assert(std::strcmp(wordgrid::direction_name(Direction::Down), "down") == 0);
  assert(std::strcmp(wordgrid::direction_name(Direction::DiagDownLeft), "down-diagonal-left") == 0);

  // Steps are (d_row, d_col): up decreases the row, left decreases the column.
  assert(wordgrid::step_of(Direction::Up).d_row == -1 && wordgrid::step_of(Direction::Up).d_col == 0);
  assert(wordgrid::step_of(Direction::DiagDownLeft).d_row == 1);
  assert(wordgrid::step_of(Direction::DiagDownLeft).d_col == -1);

  // Every step, exactly.
  const std::pair<Direction, std::pair<int, int>> expected_steps[] = {
      {Direction::LeftToRight, {0, 1}},   {Direction::RightToLeft, {0, -1}},
      {Direction::Up, {-1, 0}},           {Direction::Down, {1, 0}},
      {Direction::DiagUpLeft, {-1, -1}},  {Direction::DiagUpRight, {-1, 1}},
      {Direction::DiagDownLeft, {1, -1}}, {Direction::DiagDownRight, {1, 1}},
  };
  for (const auto& [d, step] : expected_steps) {
    assert(wordgrid::step_of(d).d_row == step.first);
    assert(wordgrid::step_of(d).d_col == step.second);
  }

  // All eight steps are distinct and none is the zero step.
  std::set<std::pair<int, int>> steps;
  for (const Direction d : wordgrid::kAllDirections) {
    const auto s = wordgrid::step_of(d);
    assert(!(s.d_row == 0 && s.d_col == 0));
    steps.emplace(s.d_row, s.d_col);

    assert(wordgrid::parse_direction(wordgrid::direction_code(d)) == d);
    assert(wordgrid::parse_direction(wordgrid::direction_name(d)) == d);
  }
  assert(steps.size() == 8);

  bool threw = false;
  try {
    (void)wordgrid::parse_direction("sideways");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  return 0;
}
