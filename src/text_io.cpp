#include "wordgrid/text_io.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace wordgrid {

std::vector<std::string> load_lines(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open '" + path + "' for reading");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    line.clear();
  }

  if (in.bad()) {
    throw std::runtime_error("error while reading '" + path + "'");
  }

  spdlog::debug("load_lines: {} lines from {}", lines.size(), path);
  return lines;
}

std::string format_report(const ResultMap& results, const ReportOptions& options) {
  const std::string& in1 = options.indent;
  const std::string in2 = in1 + in1;

  std::ostringstream out;
  out << "\nFormat of this file:"
      << "\n\nEach word found:"
      << "\n" << in1 << "Each direction the word was found in:"
      << "\n" << in2 << "(X, Y) coordinates of first letter in the word."
      << "\n\n";

  for (const auto& [word, matches] : results) {
    out << "\n\n" << word << ':';

    if (matches.empty()) {
      out << '\n' << in1 << "Not found.";
      continue;
    }

    for (const auto& [direction, locations] : matches) {
      out << '\n' << in1 << direction_code(direction) << ':';
      for (const Location& loc : locations) {
        out << '\n' << in2 << '(' << loc.x << ", " << loc.y << ')';
      }
    }
  }

  out << '\n';
  return out.str();
}

void write_report(const ResultMap& results, const std::string& path, const ReportOptions& options) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open '" + path + "' for writing");
  }

  out << format_report(results, options);
  out.flush();
  if (!out) {
    throw std::runtime_error("error while writing '" + path + "'");
  }
}

bool reports_match(const std::string& path_a, const std::string& path_b) {
  return load_lines(path_a) == load_lines(path_b);
}

} // namespace wordgrid
