#include "wordgrid/direction.h"

#include <cstddef>
#include <stdexcept>

namespace wordgrid {

namespace {

struct DirectionInfo {
  Step step;
  const char* code;
  const char* name;
};

// Indexed by the enum value.
constexpr DirectionInfo kTable[] = {
    {{0, 1}, "LR", "left-to-right"},
    {{0, -1}, "RL", "right-to-left"},
    {{-1, 0}, "U", "up"},
    {{1, 0}, "D", "down"},
    {{-1, -1}, "DUL", "up-diagonal-left"},
    {{-1, 1}, "DUR", "up-diagonal-right"},
    {{1, -1}, "DDL", "down-diagonal-left"},
    {{1, 1}, "DDR", "down-diagonal-right"},
};

inline const DirectionInfo& info(Direction d) noexcept {
  return kTable[static_cast<std::size_t>(d)];
}

} // namespace

Step step_of(Direction d) noexcept { return info(d).step; }

const char* direction_code(Direction d) noexcept { return info(d).code; }

const char* direction_name(Direction d) noexcept { return info(d).name; }

Direction parse_direction(const std::string& text) {
  for (const Direction d : kAllDirections) {
    if (text == info(d).code || text == info(d).name) {
      return d;
    }
  }
  throw std::invalid_argument("unknown direction: '" + text + "'");
}

} // namespace wordgrid
