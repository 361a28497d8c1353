#pragma once

#include <string>
#include <vector>

#include "wordgrid/solver.h"

namespace wordgrid {

// Reads a newline-delimited text file into its lines, without the line
// terminators ("\n" or "\r\n"). Throws std::runtime_error when the file
// cannot be opened or read.
std::vector<std::string> load_lines(const std::string& path);

struct ReportOptions {
  // One level of indentation. "    " gives the space-indented layout.
  std::string indent = "\t";
};

// Renders results as the human readable report:
//
//   <header>
//
//   <word>:
//   <indent><CODE>:
//   <indent><indent>(x, y)
//
// Words come out sorted; a word with no matches gets "Not found.".
std::string format_report(const ResultMap& results, const ReportOptions& options = {});

// Writes format_report() to `path`. Throws std::runtime_error on failure.
void write_report(const ResultMap& results, const std::string& path, const ReportOptions& options = {});

// Line-by-line comparison of two report files (regression check).
bool reports_match(const std::string& path_a, const std::string& path_b);

} // namespace wordgrid
