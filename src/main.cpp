#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "wordgrid/solver.h"
#include "wordgrid/text_io.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitMismatch = 2;

struct CliConfig {
  std::string words_path;
  std::string grid_path;
  std::string output_path;
  std::string compare_path;
  std::size_t threads = 1;
  bool spaces = false;
  bool verbose = false;
};

int run(const CliConfig& cfg) {
  const std::vector<std::string> words = wordgrid::load_lines(cfg.words_path);
  const wordgrid::Grid grid = wordgrid::load_lines(cfg.grid_path);
  spdlog::info("Loaded {} words from {} and a {}-row grid from {}", words.size(), cfg.words_path, grid.size(),
               cfg.grid_path);

  // threads: 1 = serial, 0 = hardware concurrency, N = N tasks.
  const wordgrid::ResultMap results =
      cfg.threads == 1 ? wordgrid::solve(words, grid) : wordgrid::solve_parallel(words, grid, cfg.threads);

  wordgrid::ReportOptions report;
  if (cfg.spaces) {
    report.indent = "    ";
  }
  wordgrid::write_report(results, cfg.output_path, report);
  spdlog::info("{} written", cfg.output_path);

  if (cfg.compare_path.empty()) {
    return kExitOk;
  }

  if (!wordgrid::reports_match(cfg.output_path, cfg.compare_path)) {
    spdlog::warn("{} and {} differ; use diff to compare them", cfg.output_path, cfg.compare_path);
    return kExitMismatch;
  }
  spdlog::info("{} and {} have identical contents", cfg.output_path, cfg.compare_path);
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  cxxopts::Options options("wordgrid", "Find every word of a word list in a letter grid, in all eight directions.");

  CliConfig cfg;
  // clang-format off
  options.add_options()
      ("w,words", "Word list, one word per line", cxxopts::value<std::string>(cfg.words_path)->default_value("word_list.txt"))
      ("g,grid", "Letter grid, one row per line", cxxopts::value<std::string>(cfg.grid_path)->default_value("word_search.txt"))
      ("o,output", "Report file to write", cxxopts::value<std::string>(cfg.output_path)->default_value("solution.txt"))
      ("c,compare", "Reference report to compare the output against", cxxopts::value<std::string>(cfg.compare_path))
      ("j,threads", "Worker tasks (0 = hardware concurrency)", cxxopts::value<std::size_t>(cfg.threads)->default_value("1"))
      ("spaces", "Indent the report with four spaces instead of tabs", cxxopts::value<bool>(cfg.spaces))
      ("v,verbose", "Debug logging", cxxopts::value<bool>(cfg.verbose))
      ("h,help", "Print usage");
  // clang-format on

  try {
    const auto parsed = options.parse(argc, argv);
    if (parsed.count("help")) {
      std::cout << options.help() << std::endl;
      return kExitOk;
    }
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    std::cerr << options.help() << std::endl;
    return kExitError;
  }

  spdlog::set_level(cfg.verbose ? spdlog::level::debug : spdlog::level::info);

  try {
    return run(cfg);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return kExitError;
  }
}
