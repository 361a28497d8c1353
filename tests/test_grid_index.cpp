#include <cassert>
#include <vector>

#include "wordgrid/grid_index.h"

int main() {
  const wordgrid::Grid grid = {
      "AAAO",
      "AAOA",
      "AOAA",
      "OAAA",
  };

  const wordgrid::GridIndex index(grid);
  assert(index.rows() == 4);
  assert(index.cols() == 4);
  assert(index.size() == 16);

  assert(index.letters().size() == 2);
  assert(index.letters()[0] == 'A');
  assert(index.letters()[1] == 'O');

  assert(index.positions('A').size() == 12);
  assert(index.positions('O').size() == 4);

  // Row-major emission order: the anti-diagonal of O's, top row first.
  const std::vector<wordgrid::Cell> expected_o = {{0, 3}, {1, 2}, {2, 1}, {3, 0}};
  assert(index.positions('O') == expected_o);

  assert(index.contains('O', {0, 3}));
  assert(!index.contains('A', {0, 3}));

  // Absent letters and off-grid cells are simply not there.
  assert(index.positions('Z').empty());
  assert(!index.contains('Z', {0, 0}));
  assert(!index.contains('A', {-1, 0}));
  assert(!index.contains('A', {0, -1}));
  assert(!index.contains('A', {4, 0}));
  assert(!index.contains('O', {0, 4}));

  // build() is the same as the constructor.
  const auto built = wordgrid::GridIndex::build(grid);
  assert(built.size() == index.size());
  assert(built.positions('O') == index.positions('O'));

  // An empty grid gives an empty index.
  const wordgrid::GridIndex empty(wordgrid::Grid{});
  assert(empty.empty());
  assert(empty.rows() == 0 && empty.cols() == 0);
  assert(empty.letters().empty());
  assert(empty.positions('A').empty());

  return 0;
}
