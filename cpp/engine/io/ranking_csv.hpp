#pragma once
/*
================================================================================
Fragment 4.2 — IO: Ranking CSV Exporter
FILE: cpp/engine/io/ranking_csv.hpp

Purpose:
  - Export a ranked analysis to CSV, one row per alternative, rank order.
  - Deterministic column ordering for diff-friendly output.

Columns:
  rank,alternative_id,name,score,distance_to_best,distance_to_worst
  Monte Carlo: alternative_id,name,mean_score,std_score,p025,p975,mean_rank,p_rank1,p_top_k

Hardening:
  - Fields containing the delimiter, a quote or a newline are quoted
  - NaN/unset values export as empty string (not "nan")
================================================================================
*/

#include <iosfwd>
#include <string>
#include <vector>

#include "engine/mcda/robustness.hpp"
#include "engine/mcda/types.hpp"

namespace mcda {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

// Quote if `s` contains the delimiter, a quote or a newline.
std::string csv_escape(const std::string& s, char delim = ',');

std::string ranking_csv_header(const CsvExportOptions& opt = CsvExportOptions());
std::string ranking_csv_row(const TopsisResult& r, const CsvExportOptions& opt = CsvExportOptions());

void write_ranking_csv(std::ostream& os, const std::vector<TopsisResult>& ranking,
                       const CsvExportOptions& opt = CsvExportOptions());

// Returns false on I/O error.
bool write_ranking_csv_file(const std::vector<TopsisResult>& ranking, const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

void write_monte_carlo_csv(std::ostream& os, const MonteCarloReport& mc,
                           const CsvExportOptions& opt = CsvExportOptions());

}  // namespace mcda
