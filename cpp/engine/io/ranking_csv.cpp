/*
================================================================================
Fragment 4.2 — IO: Ranking CSV Exporter Implementation
FILE: cpp/engine/io/ranking_csv.cpp
================================================================================
*/

#include "engine/io/ranking_csv.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace mcda {

namespace {

// Helper: format double, or empty string if NaN/unset
std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

}  // namespace

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }

  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";  // Escape quote as double-quote
    else out += c;
  }
  out += "\"";
  return out;
}

std::string ranking_csv_header(const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream h;
  h << "rank" << d << "alternative_id" << d << "name" << d << "score" << d
    << "distance_to_best" << d << "distance_to_worst";
  return h.str();
}

std::string ranking_csv_row(const TopsisResult& r, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream row;
  row << r.rank << d
      << csv_escape(r.alternative_id, d) << d
      << csv_escape(r.name, d) << d
      << csv_double(r.score, opt.precision) << d
      << csv_double(r.distance_to_best, opt.precision) << d
      << csv_double(r.distance_to_worst, opt.precision);
  return row.str();
}

void write_ranking_csv(std::ostream& os, const std::vector<TopsisResult>& ranking, const CsvExportOptions& opt) {
  if (opt.include_header) os << ranking_csv_header(opt) << "\n";
  for (const auto& r : ranking) os << ranking_csv_row(r, opt) << "\n";
}

bool write_ranking_csv_file(const std::vector<TopsisResult>& ranking, const std::string& file_path,
                            const CsvExportOptions& opt) {
  std::ofstream ofs(file_path);
  if (!ofs) return false;
  write_ranking_csv(ofs, ranking, opt);
  ofs.flush();
  return static_cast<bool>(ofs);
}

void write_monte_carlo_csv(std::ostream& os, const MonteCarloReport& mc, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  const int p = opt.precision;
  if (opt.include_header) {
    os << "alternative_id" << d << "name" << d << "mean_score" << d << "std_score" << d << "p025" << d
       << "p975" << d << "mean_rank" << d << "p_rank1" << d << "p_top_k" << "\n";
  }
  for (const auto& a : mc.alternatives) {
    os << csv_escape(a.alternative_id, d) << d
       << csv_escape(a.name, d) << d
       << csv_double(a.mean_score, p) << d
       << csv_double(a.std_score, p) << d
       << csv_double(a.p025, p) << d
       << csv_double(a.p975, p) << d
       << csv_double(a.mean_rank, p) << d
       << csv_double(a.p_rank1, p) << d
       << csv_double(a.p_top_k, p) << "\n";
  }
}

}  // namespace mcda
