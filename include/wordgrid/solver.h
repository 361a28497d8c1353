#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "wordgrid/direction.h"
#include "wordgrid/grid_index.h"

namespace wordgrid {

// Public coordinate of a match: (x, y) = (column, row) of the word's first
// letter. Internally everything runs in (row, col); the swap happens only
// when a match is recorded.
struct Location {
  int x = 0;
  int y = 0;

  bool operator==(const Location& o) const noexcept { return x == o.x && y == o.y; }
  bool operator!=(const Location& o) const noexcept { return !(*this == o); }
};

using DirectionMatches = std::map<Direction, std::vector<Location>>;

// word (case preserved) -> direction -> start locations.
// Ordered by word so reports come out sorted. A word that was searched but
// not found maps to an empty DirectionMatches.
using ResultMap = std::map<std::string, DirectionMatches>;

// Start locations from which `word` reads along `direction`.
//
// Candidates are the index entries for the word's first character (after
// uppercasing). Spaces in the word are skips: they neither consume a cell
// nor advance the walk. Every other character must be present in the index
// at the running cell, which makes leaving the grid equivalent to a
// mismatch.
//
// Results follow the index's emission order. An empty word yields nothing.
std::vector<Location> search_word(const std::string& word, Direction direction, const GridIndex& index);

// Every word in every direction. Each input word appears exactly once as a
// key; duplicates collapse.
ResultMap solve(const std::vector<std::string>& words, const GridIndex& index);
ResultMap solve(const std::vector<std::string>& words, const Grid& grid);

// Number of tasks solve_parallel() launches for `words` words.
// threads == 0 means std::thread::hardware_concurrency(); any request is
// capped at that, and at the word count.
std::size_t worker_count(std::size_t threads, std::size_t words) noexcept;

// Same result as solve(), with the word list split into at most
// worker_count(threads, words.size()) contiguous chunks searched
// concurrently against one shared index.
ResultMap solve_parallel(const std::vector<std::string>& words, const Grid& grid, std::size_t threads = 0);

} // namespace wordgrid
