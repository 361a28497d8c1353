#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "wordgrid/grid_index.h"
#include "wordgrid/solver.h"
#include "wordgrid/text_io.h"

namespace py = pybind11;

namespace {

// Locations cross into Python as (x, y) tuples and directions as their
// report codes, so results look like {"LCD": {"D": [(0, 1)]}}.

inline py::list to_py(const std::vector<wordgrid::Location>& locations) {
  py::list out;
  for (const auto& loc : locations) {
    out.append(py::make_tuple(loc.x, loc.y));
  }
  return out;
}

inline py::dict to_py(const wordgrid::ResultMap& results) {
  py::dict out;
  for (const auto& [word, matches] : results) {
    py::dict by_direction;
    for (const auto& [direction, locations] : matches) {
      by_direction[wordgrid::direction_code(direction)] = to_py(locations);
    }
    out[py::str(word)] = std::move(by_direction);
  }
  return out;
}

inline char require_single_char(const std::string& s) {
  if (s.size() != 1) {
    throw std::invalid_argument("Expected a single character, got '" + s + "'");
  }
  return s.front();
}

} // namespace

PYBIND11_MODULE(wordgrid, m) {
  m.doc() = "WordGrid: indexed eight-direction word search (pybind11)";

  // std::invalid_argument already maps to ValueError; std::runtime_error
  // maps to RuntimeError.

  py::class_<wordgrid::GridIndex>(m, "GridIndex")
      .def(py::init<const wordgrid::Grid&>(), py::arg("grid"))
      .def_property_readonly("rows", &wordgrid::GridIndex::rows)
      .def_property_readonly("cols", &wordgrid::GridIndex::cols)
      .def_property_readonly("size", &wordgrid::GridIndex::size)
      .def(
          "positions",
          [](const wordgrid::GridIndex& self, const std::string& letter) {
            py::list out;
            for (const auto& cell : self.positions(require_single_char(letter))) {
              out.append(py::make_tuple(cell.row, cell.col));
            }
            return out;
          },
          py::arg("letter"),
          "Cells holding the letter as (row, col) tuples, row-major.")
      .def(
          "contains",
          [](const wordgrid::GridIndex& self, const std::string& letter, int row, int col) {
            return self.contains(require_single_char(letter), wordgrid::Cell{row, col});
          },
          py::arg("letter"),
          py::arg("row"),
          py::arg("col"));

  // search_word("AAOA", "LR", index) -> [(0, 1)]
  m.def(
      "search_word",
      [](const std::string& word, const std::string& direction, const wordgrid::GridIndex& index) {
        return to_py(wordgrid::search_word(word, wordgrid::parse_direction(direction), index));
      },
      py::arg("word"),
      py::arg("direction"),
      py::arg("index"),
      "Start locations (x, y) of `word` read along `direction` (code or long name).");

  m.def(
      "solve",
      [](const std::vector<std::string>& words, const wordgrid::Grid& grid, std::size_t threads) {
        if (threads == 1) {
          return to_py(wordgrid::solve(words, grid));
        }
        wordgrid::ResultMap results;
        {
          py::gil_scoped_release release;
          results = wordgrid::solve_parallel(words, grid, threads);
        }
        return to_py(results);
      },
      py::arg("words"),
      py::arg("grid"),
      py::arg("threads") = 1,
      "{word: {direction_code: [(x, y), ...]}} for every word.");

  m.def("load_lines", &wordgrid::load_lines, py::arg("path"));

  m.def(
      "write_report",
      [](const std::vector<std::string>& words, const wordgrid::Grid& grid, const std::string& path,
         const std::string& indent) {
        wordgrid::ReportOptions options;
        options.indent = indent;
        wordgrid::write_report(wordgrid::solve(words, grid), path, options);
      },
      py::arg("words"),
      py::arg("grid"),
      py::arg("path"),
      py::arg("indent") = "\t",
      "Solve and write the text report to `path`.");

  m.def("reports_match", &wordgrid::reports_match, py::arg("path_a"), py::arg("path_b"));
}
