/*
================================================================================
Fragment 5.0 — CLI: Main Entry Point (mcda_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the MCDA site-ranking engine.
  - Reads an analysis request (JSON), runs the engine, prints JSON to stdout.
  - The engine itself never touches files; all I/O lives here.

Usage:
  mcda_cli [--log-level debug|info|warn|error] <command> [options]

Commands:
  rank         Validate + weight + rank a request
  sensitivity  Weight sensitivity, diagnostics, fuzzy ranges
  montecarlo   Monte Carlo robustness of the ranking
  criteria     List the criterion catalog
  pairs        List the pairwise comparisons needed for AHP
  help         Show help message

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures
  - Deterministic output format
================================================================================
*/

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/io/analysis_json.hpp"
#include "engine/io/ranking_csv.hpp"
#include "engine/mcda/ahp.hpp"
#include "engine/mcda/criterion_catalog.hpp"
#include "engine/mcda/orchestrator.hpp"
#include "engine/mcda/robustness.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace mcda;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

void print_help() {
  std::cout << R"(
mcda_cli - Multi-criteria site ranking (AHP / direct weights + TOPSIS)

Usage:
  mcda_cli [--log-level debug|info|warn|error] <command> [options]

Commands:
  rank <request.json> [--csv <file>] [--compact]
                Run the analysis and print the JSON response
  sensitivity <request.json> [--compact]
                Weight sensitivity (+-10/20%), criterion diagnostics and,
                when the request carries "fuzzy_weights", fuzzy score ranges
  montecarlo <request.json> [--samples N] [--seed S] [--csv <file>] [--compact]
                Perturb weights and values, report ranking robustness
  criteria      List the criterion catalog
  pairs <id> <id> ...
                List the pairwise comparisons AHP needs for these criteria
  help          Show this help message

Request file "-" reads stdin.

Examples:
  mcda_cli rank request.json --csv ranking.csv
  mcda_cli montecarlo request.json --samples 5000 --seed 42
  mcda_cli pairs cost_usd capacity_kw catchment_population

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed (malformed request or rejected by the validator)
  3 - Computation failed
  4 - I/O error
)";
}

struct Args {
  std::vector<std::string> positional;
  std::string csv_path;
  bool compact = false;
  bool has_samples = false;
  std::size_t samples = 0;
  bool has_seed = false;
  std::uint64_t seed = 0;
};

bool parse_u64(const std::string& s, std::uint64_t* out) {
  if (s.empty() || s[0] == '-') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = static_cast<std::uint64_t>(v);
  return true;
}

// Splits flags from positionals. Returns false with `err` set on a bad flag.
bool parse_args(const std::vector<std::string>& in, Args* a, std::string* err) {
  for (std::size_t i = 0; i < in.size(); ++i) {
    const std::string& k = in[i];
    auto next = [&](const char* flag, std::string* v) {
      if (i + 1 >= in.size()) {
        *err = std::string(flag) + " requires a value";
        return false;
      }
      *v = in[++i];
      return true;
    };

    if (k == "--csv") {
      if (!next("--csv", &a->csv_path)) return false;
    } else if (k == "--compact") {
      a->compact = true;
    } else if (k == "--samples") {
      std::string v;
      std::uint64_t n = 0;
      if (!next("--samples", &v)) return false;
      if (!parse_u64(v, &n)) { *err = "--samples must be a non-negative integer"; return false; }
      a->has_samples = true;
      a->samples = static_cast<std::size_t>(n);
    } else if (k == "--seed") {
      std::string v;
      if (!next("--seed", &v)) return false;
      if (!parse_u64(v, &a->seed)) { *err = "--seed must be a non-negative integer"; return false; }
      a->has_seed = true;
    } else if (k.size() > 2 && k.compare(0, 2, "--") == 0) {
      *err = "Unknown option: " + k;
      return false;
    } else {
      a->positional.push_back(k);
    }
  }
  return true;
}

bool read_text(const std::string& path, std::string* out) {
  std::ostringstream ss;
  if (path == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) return false;
    ss << f.rdbuf();
  }
  *out = ss.str();
  return true;
}

// Loads and parses a request file. Returns SUCCESS or the exit code to use.
int load_request(const std::string& path, AnalysisInput* in) {
  std::string text;
  if (!read_text(path, &text)) {
    log(LogLevel::ERROR, "cannot read request file: " + path);
    return IO_ERROR;
  }
  JsonParseError perr;
  if (!parse_analysis_input_json(text, in, &perr)) {
    log(LogLevel::ERROR, "malformed request " + path + " (" + perr.to_string() + ")");
    return VALIDATION_FAILED;
  }
  log(LogLevel::DEBUG, "request " + path + ": " + std::to_string(in->request.criteria.size()) + " criteria, " +
                           std::to_string(in->alternatives.size()) + " alternatives");
  return SUCCESS;
}

int exit_code_for(const AnalysisResponse& r) {
  if (r.ok()) return SUCCESS;
  return r.failed_stage == AnalysisStage::Validate ? VALIDATION_FAILED : COMPUTATION_FAILED;
}

JsonWriteOptions json_options(const Args& a) {
  JsonWriteOptions opt;
  opt.pretty = !a.compact;
  return opt;
}

// Runs the base analysis. On failure prints the response so the analyst sees
// the errors, and returns the exit code.
int run_base(const Analyzer& analyzer, const AnalysisInput& in, const Args& a, AnalysisResponse* out) {
  *out = analyzer.analyze(in.request, in.alternatives);
  if (!out->ok()) {
    write_analysis_response_json(std::cout, *out, json_options(a));
    for (const auto& e : out->validation_errors) log(LogLevel::WARN, e);
  }
  return exit_code_for(*out);
}

int cmd_rank(const Args& a) {
  if (a.positional.size() != 1) {
    std::cerr << "rank: expected exactly one request file\n";
    return INVALID_ARGS;
  }

  AnalysisInput in;
  if (const int rc = load_request(a.positional[0], &in); rc != SUCCESS) return rc;

  const Analyzer analyzer;
  const AnalysisResponse r = analyzer.analyze(in.request, in.alternatives);
  write_analysis_response_json(std::cout, r, json_options(a));

  if (!r.ok()) {
    for (const auto& e : r.validation_errors) log(LogLevel::WARN, e);
    return exit_code_for(r);
  }

  if (r.ahp && !r.ahp->is_consistent) {
    std::ostringstream ss;
    ss << "AHP judgements are inconsistent (CR = " << std::fixed << std::setprecision(3)
       << r.ahp->consistency_ratio << "); consider revising the comparisons";
    log(LogLevel::WARN, ss.str());
  }

  if (!a.csv_path.empty()) {
    if (!write_ranking_csv_file(r.ranking, a.csv_path)) {
      log(LogLevel::ERROR, "cannot write CSV: " + a.csv_path);
      return IO_ERROR;
    }
    log(LogLevel::INFO, "ranking written to " + a.csv_path);
  }
  return SUCCESS;
}

int cmd_sensitivity(const Args& a) {
  if (a.positional.size() != 1) {
    std::cerr << "sensitivity: expected exactly one request file\n";
    return INVALID_ARGS;
  }

  AnalysisInput in;
  if (const int rc = load_request(a.positional[0], &in); rc != SUCCESS) return rc;

  const Analyzer analyzer;
  AnalysisResponse base;
  if (const int rc = run_base(analyzer, in, a, &base); rc != SUCCESS) return rc;

  try {
    const RobustnessAnalyzer robust(analyzer.settings());
    const SensitivityReport sens = robust.weight_sensitivity(base.alternatives, base.criteria);
    const Diagnostics diag = robust.diagnostics(base.alternatives, base.criteria);

    FuzzyReport fuzzy;
    const bool has_fuzzy = !in.fuzzy_weights.empty();
    if (has_fuzzy) fuzzy = robust.fuzzy_ranges(base.alternatives, base.criteria, in.fuzzy_weights);

    write_robustness_json(std::cout, base.alternatives, sens, diag, has_fuzzy ? &fuzzy : nullptr, json_options(a));
  } catch (const McdaError& e) {
    log(LogLevel::ERROR, std::string("sensitivity failed [") + to_string(e.code()) + "]: " + e.what());
    return e.code() == ErrorCode::InvalidInput ? VALIDATION_FAILED : COMPUTATION_FAILED;
  }
  return SUCCESS;
}

int cmd_montecarlo(const Args& a) {
  if (a.positional.size() != 1) {
    std::cerr << "montecarlo: expected exactly one request file\n";
    return INVALID_ARGS;
  }

  EngineSettings settings = EngineSettings::defaults();
  if (a.has_samples) settings.monte_carlo.samples = a.samples;
  if (a.has_seed) settings.monte_carlo.seed = a.seed;
  try {
    settings.validate_or_throw();
  } catch (const McdaError& e) {
    std::cerr << "montecarlo: " << e.what() << "\n";
    return INVALID_ARGS;
  }

  AnalysisInput in;
  if (const int rc = load_request(a.positional[0], &in); rc != SUCCESS) return rc;

  const Analyzer analyzer(settings);
  AnalysisResponse base;
  if (const int rc = run_base(analyzer, in, a, &base); rc != SUCCESS) return rc;

  MonteCarloReport mc;
  try {
    const RobustnessAnalyzer robust(settings);
    mc = robust.monte_carlo(base.alternatives, base.criteria);
  } catch (const McdaError& e) {
    log(LogLevel::ERROR, std::string("monte carlo failed [") + to_string(e.code()) + "]: " + e.what());
    return COMPUTATION_FAILED;
  }

  write_monte_carlo_json(std::cout, mc, json_options(a));

  if (!a.csv_path.empty()) {
    std::ofstream f(a.csv_path, std::ios::binary | std::ios::trunc);
    if (f.good()) write_monte_carlo_csv(f, mc);
    if (!f.good()) {
      log(LogLevel::ERROR, "cannot write CSV: " + a.csv_path);
      return IO_ERROR;
    }
  }
  return SUCCESS;
}

int cmd_criteria() {
  std::cout << std::left << std::setw(32) << "id" << std::setw(8) << "dir" << std::setw(16) << "source"
            << std::setw(9) << "unit" << "name\n";
  for (const auto& c : CriterionCatalog::all()) {
    std::cout << std::left << std::setw(32) << std::string(c.id) << std::setw(8) << to_string(c.direction)
              << std::setw(16) << to_string(c.source) << std::setw(9) << std::string(c.unit)
              << std::string(c.name) << "\n";
  }
  return SUCCESS;
}

int cmd_pairs(const Args& a) {
  if (a.positional.size() < 2) {
    std::cerr << "pairs: expected at least two criterion ids\n";
    return INVALID_ARGS;
  }
  for (const auto& id : a.positional) {
    if (!CriterionCatalog::contains(id)) log(LogLevel::WARN, "not in the criterion catalog: " + id);
  }

  const auto pairs = generate_comparison_pairs(a.positional);
  std::cout << pairs.size() << " comparisons required\n";
  std::size_t k = 0;
  for (const auto& [lhs, rhs] : pairs) std::cout << "  " << ++k << ". " << lhs << " vs " << rhs << "\n";

  std::cout << "\nScale (value = how much more important the first criterion is):\n";
  for (int v = 1; v <= 9; ++v) std::cout << "  " << v << "  " << describe_comparison(v) << "\n";
  std::cout << "  Use 1/v when the second criterion is more important.\n";
  return SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  // stdout carries the JSON / table output.
  set_log_stderr_only(true);

  std::vector<std::string> rest;
  for (int i = 1; i < argc; ++i) {
    const std::string k = argv[i];
    if (k == "--log-level") {
      LogLevel lvl = LogLevel::INFO;
      if (i + 1 >= argc || !parse_log_level(argv[i + 1], lvl)) {
        std::cerr << "--log-level must be one of debug|info|warn|error\n";
        return INVALID_ARGS;
      }
      set_log_level(lvl);
      ++i;
      continue;
    }
    rest.push_back(k);
  }

  // Parse command
  const std::string cmd = rest.empty() ? std::string("help") : rest.front();
  if (!rest.empty()) rest.erase(rest.begin());

  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  Args a;
  std::string err;
  if (!parse_args(rest, &a, &err)) {
    std::cerr << cmd << ": " << err << "\n";
    return INVALID_ARGS;
  }

  try {
    if (cmd == "rank") return cmd_rank(a);
    if (cmd == "sensitivity") return cmd_sensitivity(a);
    if (cmd == "montecarlo") return cmd_montecarlo(a);
    if (cmd == "criteria") return cmd_criteria();
    if (cmd == "pairs") return cmd_pairs(a);
  } catch (const McdaError& e) {
    std::cerr << "Error [" << to_string(e.code()) << "]: " << e.what() << "\n";
    return e.code() == ErrorCode::InvalidConfig ? INVALID_ARGS : COMPUTATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'mcda_cli help' for usage information.\n";
  return INVALID_ARGS;
}
