#include "wordgrid/solver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <thread>
#include <utility>

namespace wordgrid {

namespace {

inline std::string to_upper(const std::string& word) {
  std::string out = word;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return out;
}

void solve_into(ResultMap& results, const std::string& word, const GridIndex& index) {
  DirectionMatches& matches = results[word];
  for (const Direction d : kAllDirections) {
    std::vector<Location> found = search_word(word, d, index);
    if (!found.empty()) {
      matches[d] = std::move(found);
    }
  }
}

inline bool debug_enabled() noexcept {
  return spdlog::default_logger_raw()->should_log(spdlog::level::debug);
}

std::size_t count_found(const ResultMap& results) noexcept {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(), [](const auto& kv) { return !kv.second.empty(); }));
}

} // namespace

std::vector<Location> search_word(const std::string& word, Direction direction, const GridIndex& index) {
  if (word.empty()) {
    return {};
  }

  const std::string upper = to_upper(word);
  const Step step = step_of(direction);

  std::vector<Location> results;

  // The first character is the anchor even when it is a space: index 0 is
  // checked (or skipped) before any step is applied.
  for (const Cell& start : index.positions(upper.front())) {
    Cell cur = start;
    bool matched = true;

    for (const char ch : upper) {
      if (ch == ' ') {
        continue;
      }
      if (!index.contains(ch, cur)) {
        matched = false;
        break;
      }
      cur.row += step.d_row;
      cur.col += step.d_col;
    }

    if (matched) {
      results.push_back(Location{start.col, start.row});
    }
  }

  return results;
}

ResultMap solve(const std::vector<std::string>& words, const GridIndex& index) {
  ResultMap results;
  for (const std::string& word : words) {
    solve_into(results, word, index);
  }

  if (debug_enabled()) {
    spdlog::debug("solve: {} words, {} found", results.size(), count_found(results));
  }
  return results;
}

ResultMap solve(const std::vector<std::string>& words, const Grid& grid) {
  const GridIndex index(grid);
  return solve(words, index);
}

std::size_t worker_count(std::size_t threads, std::size_t words) noexcept {
  if (words == 0) {
    return 0;
  }
  const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  const std::size_t wanted = threads == 0 ? hw : std::min(threads, hw);
  return std::min(wanted, words);
}

ResultMap solve_parallel(const std::vector<std::string>& words, const Grid& grid, std::size_t threads) {
  const GridIndex index(grid);

  const std::size_t n = words.size();
  const std::size_t tasks = std::max<std::size_t>(1, worker_count(threads, n));
  const std::size_t chunk = (n + tasks - 1) / tasks;

  // Each task owns a disjoint slice of the word list and its own map;
  // the index is shared read-only.
  std::vector<std::future<ResultMap>> futures;
  futures.reserve(tasks);
  for (std::size_t begin = 0; begin < n; begin += chunk) {
    const std::size_t end = std::min(n, begin + chunk);
    futures.push_back(std::async(std::launch::async, [&words, &index, begin, end] {
      ResultMap partial;
      for (std::size_t i = begin; i < end; ++i) {
        solve_into(partial, words[i], index);
      }
      return partial;
    }));
  }

  ResultMap results;
  for (auto& f : futures) {
    ResultMap partial = f.get();
    // The same word in two slices produces identical entries, so either
    // copy may win.
    results.merge(partial);
  }

  if (debug_enabled()) {
    spdlog::debug("solve_parallel: {} words, {} found, {} tasks", results.size(), count_found(results),
                  futures.size());
  }
  return results;
}

} // namespace wordgrid
