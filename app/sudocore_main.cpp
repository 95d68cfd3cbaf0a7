#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "PuzzleFormat.hpp"
#include "SudokuSolver.hpp"
#include "log.hpp"

struct CliOptions {
  SolverConfig config;
  std::string path;
  bool gridFormat = false;
  bool showStats = false;
};

static std::string trim(const std::string &s) {
  size_t a = 0;
  while (a < s.size() && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r' || s[a] == '\n')) {
    a++;
  }
  size_t b = s.size();
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) {
    b--;
  }
  return s.substr(a, b - a);
}

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " [options] <puzzle_file | ->\n"
      << "  Each non-empty, non-comment line must contain 81 cells: digits 0-9 or '.' for empty.\n"
      << "Options:\n"
      << "  --max-nodes=N       search node budget (0 = unlimited, default " << DEFAULT_MAX_NODES << ")\n"
      << "  --no-advanced       only full house, naked and hidden singles before search\n"
      << "  --format=line|grid  how solutions are printed (default line)\n"
      << "  --stats             print search and deduction counters\n"
      << "  --verbose           log solver progress to stderr\n";
}

static bool parseArgs(int argc, char **argv, CliOptions &opts) {
  for (int i = 1; i < argc; i++) {
    const std::string a = argv[i];
    if (a.rfind("--max-nodes=", 0) == 0) {
      const std::string v = a.substr(std::strlen("--max-nodes="));
      char *end = nullptr;
      const unsigned long long n = std::strtoull(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0') {
        std::cerr << "Invalid node budget: " << v << "\n";
        return false;
      }
      opts.config.maxNodes = n;
    } else if (a == "--no-advanced") {
      opts.config.techniques = TECH_FULL_HOUSE | TECH_SINGLES;
    } else if (a.rfind("--format=", 0) == 0) {
      const std::string v = a.substr(std::strlen("--format="));
      if (v == "grid") {
        opts.gridFormat = true;
      } else if (v == "line") {
        opts.gridFormat = false;
      } else {
        std::cerr << "Unknown format: " << v << "\n";
        return false;
      }
    } else if (a == "--stats") {
      opts.showStats = true;
    } else if (a == "--verbose") {
      setLogLevel(LogLevel::Debug);
    } else if (a == "-" || a.rfind("-", 0) != 0) {
      if (!opts.path.empty()) {
        std::cerr << "Only one puzzle file may be given\n";
        return false;
      }
      opts.path = a;
    } else {
      std::cerr << "Unknown option: " << a << "\n";
      return false;
    }
  }
  return !opts.path.empty();
}

static void printGrid(const Grid &grid, bool gridFormat) {
  if (gridFormat) {
    std::cout << formatGrid(grid.data());
  } else {
    std::cout << format81(grid.data()) << "\n";
  }
}

static void printStats(const SolveStats &stats) {
  std::cout << "STATS:  nodes=" << stats.nodes
            << " guesses=" << stats.guesses
            << " contradictions=" << stats.contradictions
            << " maxDepth=" << stats.maxDepth << "\n";
  std::cout << "RULES: ";
  for (int r = 1; r < REASON_COUNT; r++) {
    std::cout << " " << reasonName(static_cast<ReasonId>(r)) << "=" << stats.applied[r] << ";";
  }
  std::cout << "\n";
}

int main(int argc, char **argv) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    usage(argv[0]);
    return 2;
  }

  std::ifstream fin;
  if (opts.path != "-") {
    fin.open(opts.path);
    if (!fin) {
      std::cerr << "Failed to open file: " << opts.path << "\n";
      return 2;
    }
  }
  std::istream &in = (opts.path == "-") ? std::cin : fin;

  const SudokuSolver solver(opts.config);

  size_t total = 0;
  size_t unreadable = 0;
  size_t counts[5] = { 0, 0, 0, 0, 0 };

  std::string line;
  size_t lineNo = 0;

  while (std::getline(in, line)) {
    lineNo++;

    const std::string t = trim(line);
    // Allow comments and blank lines
    if (t.empty() || t[0] == '#') {
      continue;
    }

    total++;

    uint8_t values[81];
    std::string err;
    if (!parse81(t, values, &err)) {
      unreadable++;
      std::cout << "[#" << total << " line " << lineNo << "] " << "\n"
                << "INPUT:  " << t << "\n"
                << "RESULT: UNREADABLE (" << err << ")\n\n";
      continue;
    }

    const Outcome outcome = solver.solve(values);
    counts[static_cast<int>(outcome.status)]++;

    std::cout << "[#" << total << " line " << lineNo << "] " << "\n"
              << "INPUT:  " << format81(values) << "\n"
              << "RESULT: " << outcomeName(outcome.status);
    if (!outcome.reason.empty()) {
      std::cout << " (" << outcome.reason << ")";
    }
    std::cout << "\n";

    for (const Grid &grid : outcome.solutions) {
      if (!opts.gridFormat) {
        std::cout << "OUTPUT: ";
      }
      printGrid(grid, opts.gridFormat);
    }
    if (opts.showStats) {
      printStats(outcome.stats);
    }
    std::cout << "\n";
  }

  std::cout << "SUMMARY: total=" << total
            << " solved=" << counts[static_cast<int>(OutcomeStatus::Solved)]
            << " unsolvable=" << counts[static_cast<int>(OutcomeStatus::Unsolvable)]
            << " multiple=" << counts[static_cast<int>(OutcomeStatus::MultipleSolutions)]
            << " invalid=" << counts[static_cast<int>(OutcomeStatus::InvalidInput)]
            << " aborted=" << counts[static_cast<int>(OutcomeStatus::SearchAborted)]
            << " unreadable=" << unreadable << "\n";

  return unreadable == 0 ? 0 : 1;
}
