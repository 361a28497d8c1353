#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wordgrid {

// Rows of letters, one character per column.
using Grid = std::vector<std::string>;

// Internal coordinate, (row, col) order to match the row-major grid layout.
struct Cell {
  int row = 0;
  int col = 0;

  bool operator==(const Cell& o) const noexcept { return row == o.row && col == o.col; }
  bool operator!=(const Cell& o) const noexcept { return !(*this == o); }
};

// GridIndex
// ---------
// Letter -> every cell holding that letter.
//
// Each letter keeps two views of the same cells:
// - an ordered list in row-major emission order (candidate iteration),
// - a hash set of packed cells (O(1) average membership).
//
// Only cells that exist in the grid are ever recorded, so a membership test
// doubles as a bounds check: a coordinate that walked off the grid is simply
// never found.
//
// The index is built once from a grid and is read-only afterwards; it is safe
// to share across threads.

class GridIndex {
public:
  GridIndex() = default;
  explicit GridIndex(const Grid& grid);

  static GridIndex build(const Grid& grid) { return GridIndex(grid); }

  std::size_t rows() const noexcept { return rows_; }
  std::size_t cols() const noexcept { return cols_; }

  // Number of cells recorded.
  std::size_t size() const noexcept { return size_; }

  bool empty() const noexcept { return size_ == 0; }

  // Distinct characters, in first-seen order.
  const std::vector<char>& letters() const noexcept { return letters_; }

  // Cells holding `letter`, row-major. Empty when the letter is absent.
  const std::vector<Cell>& positions(char letter) const noexcept;

  bool contains(char letter, Cell cell) const noexcept;

private:
  struct Entry {
    std::vector<Cell> cells;
    std::unordered_set<std::uint64_t> lookup;
  };

  static std::uint64_t pack(Cell cell) noexcept;

  std::size_t rows_ = 0;
  std::size_t cols_ = 0;
  std::size_t size_ = 0;

  std::vector<char> letters_;
  std::unordered_map<char, Entry> entries_;
};

} // namespace wordgrid
