#include "wordgrid/grid_index.h"

#include <spdlog/spdlog.h>

namespace wordgrid {

namespace {
const std::vector<Cell> kNoCells;
}

GridIndex::GridIndex(const Grid& grid) : rows_(grid.size()), cols_(grid.empty() ? 0 : grid.front().size()) {
  for (std::size_t r = 0; r < grid.size(); ++r) {
    const std::string& row = grid[r];
    for (std::size_t c = 0; c < row.size(); ++c) {
      const char letter = row[c];
      const Cell cell{static_cast<int>(r), static_cast<int>(c)};

      auto [it, inserted] = entries_.try_emplace(letter);
      if (inserted) {
        letters_.push_back(letter);
      }
      it->second.cells.push_back(cell);
      it->second.lookup.insert(pack(cell));
      ++size_;
    }
  }

  spdlog::debug("GridIndex: {}x{} grid, {} cells, {} distinct letters", rows_, cols_, size_, letters_.size());
}

std::uint64_t GridIndex::pack(Cell cell) noexcept {
  // Negative coordinates (a walk that left the grid) pack to values no real
  // cell can produce, so they miss like any other absent key.
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.row)) << 32) |
         static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.col));
}

const std::vector<Cell>& GridIndex::positions(char letter) const noexcept {
  const auto it = entries_.find(letter);
  return it == entries_.end() ? kNoCells : it->second.cells;
}

bool GridIndex::contains(char letter, Cell cell) const noexcept {
  const auto it = entries_.find(letter);
  if (it == entries_.end()) {
    return false;
  }
  return it->second.lookup.count(pack(cell)) != 0;
}

} // namespace wordgrid
