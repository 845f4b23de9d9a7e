/*
  Fragment 4.1.T — Analysis JSON / CSV Selftest

  Objective
  ---------
  Framework-free checks of the file surface the CLI depends on:
    1) Request documents parse into AnalysisRequest + Alternatives
       (method aliases, default alternative_ids, null values dropped).
    2) Schema violations fail the parse with a readable message.
    3) The reader is strict JSON (no NaN, no trailing commas) and reports
       line/column.
    4) Response JSON is valid JSON: no NaN, "ahp_diagnostics" null for the
       direct method, stable key set.
    5) CSV quoting and empty fields for non-finite numbers.

  Expected use
  ------------
      ./analysis_json_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/io/analysis_json.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/ranking_csv.hpp"
#include "engine/mcda/orchestrator.hpp"

namespace {

using namespace mcda;
using namespace mcda::selftest;

constexpr std::string_view kDirectDoc = R"({
  "method": "TOPSIS_W",
  "criteria": ["cost_usd", "capacity_kw"],
  "weights": {"cost_usd": 0.5, "capacity_kw": 0.5},
  "alternatives": [
    {"id": "A", "name": "Site A", "values": {"cost_usd": 100, "capacity_kw": 5}},
    {"id": "B", "values": {"cost_usd": 200, "capacity_kw": 10, "pv_npv": null}},
    {"id": "C", "name": "Site C", "values": {"cost_usd": 150, "capacity_kw": 8}}
  ]
})";

constexpr std::string_view kAhpDoc = R"({
  "method": "TOPSIS_AHP",
  "criteria": ["cost_usd", "capacity_kw"],
  "alternative_ids": ["C", "A", "B"],
  "pairwise_comparisons": [{"a": "cost_usd", "b": "capacity_kw", "value": 3}],
  "fuzzy_weights": {"cost_usd": [0.5, 0.75, 0.9], "capacity_kw": [0.1, 0.25, 0.5]},
  "alternatives": [
    {"id": "A", "values": {"cost_usd": 100, "capacity_kw": 5}},
    {"id": "B", "values": {"cost_usd": 200, "capacity_kw": 10}},
    {"id": "C", "values": {"cost_usd": 150, "capacity_kw": 8}}
  ]
})";

void test_parse_direct() {
  AnalysisInput in;
  JsonParseError err;
  const bool ok = parse_analysis_input_json(kDirectDoc, &in, &err);
  expect_true(ok, "parse direct: ok");
  if (!ok) {
    std::cerr << "  " << err.to_string() << "\n";
    return;
  }

  expect_true(in.request.method == WeightingMethod::Direct, "parse direct: TOPSIS_W alias");
  expect_true(in.request.criteria.size() == 2 && in.request.criteria[0] == "cost_usd", "parse direct: criteria order");
  expect_true(in.request.weights.size() == 2 && in.request.weights.at("capacity_kw") == 0.5, "parse direct: weights");
  expect_true(in.request.alternative_ids == std::vector<std::string>({"A", "B", "C"}),
              "parse direct: alternative_ids default to rows");
  expect_eq_str(in.alternatives[1].name, "B", "parse direct: name defaults to id");
  expect_true(in.alternatives[1].values.count("pv_npv") == 0, "parse direct: null value dropped");
  expect_true(in.fuzzy_weights.empty(), "parse direct: no fuzzy weights");
}

void test_parse_ahp() {
  AnalysisInput in;
  const bool ok = parse_analysis_input_json(kAhpDoc, &in);
  expect_true(ok, "parse ahp: ok");
  if (!ok) return;

  expect_true(in.request.method == WeightingMethod::Ahp, "parse ahp: TOPSIS_AHP alias");
  expect_true(in.request.alternative_ids == std::vector<std::string>({"C", "A", "B"}),
              "parse ahp: explicit alternative_ids kept");
  expect_true(in.request.pairwise_comparisons.size() == 1 && in.request.pairwise_comparisons[0].value == 3.0,
              "parse ahp: comparison");
  expect_true(in.fuzzy_weights.size() == 2 && in.fuzzy_weights.at("cost_usd").mid == 0.75, "parse ahp: fuzzy");
}

void expect_schema_error(std::string_view doc, const std::string& want, const char* what) {
  AnalysisInput in;
  JsonParseError err;
  const bool ok = parse_analysis_input_json(doc, &in, &err);
  expect_true(!ok, what);
  if (!ok) expect_eq_str(err.message, want, what);
}

void test_schema_errors() {
  expect_schema_error(R"({"weights": {}})", "Missing required field: criteria", "schema: criteria required");
  expect_schema_error(R"([1, 2])", "Root must be an object", "schema: root object");
  expect_schema_error(R"({"method": "electre", "criteria": []})", "Unknown method: electre", "schema: unknown method");
  expect_schema_error(R"({"criteria": ["x"], "weights": {"x": "high"}})", "weights.x must be a number",
                      "schema: weight type");
  expect_schema_error(R"({"criteria": ["x"], "alternatives": [{"name": "no id"}]})",
                      "alternatives[0].id is required string", "schema: alternative id");
  expect_schema_error(R"({"criteria": ["x"], "pairwise_comparisons": [{"a": "x", "b": "y"}]})",
                      "pairwise_comparisons[0].value is required number", "schema: comparison value");
  expect_schema_error(R"({"criteria": ["x"], "fuzzy_weights": {"x": [0.1, 0.2]}})",
                      "fuzzy_weights.x must be [low, mid, high]", "schema: fuzzy triple");
}

void test_strict_json() {
  JsonValue v;
  JsonParseError err;

  expect_true(!parse_json("{\n  \"a\": NaN\n}", &v, &err), "strict: NaN rejected");
  expect_true(err.line == 2 && err.col == 8, "strict: error line/col");
  expect_eq_str(err.message, "Unexpected token", "strict: error message");

  expect_true(!parse_json("[1, 2,]", &v, &err), "strict: trailing comma rejected");
  expect_true(!parse_json("{} x", &v, &err), "strict: trailing characters rejected");
  expect_true(!parse_json("+1", &v, &err), "strict: leading plus rejected");

  std::string deep(300, '[');
  deep += std::string(300, ']');
  expect_true(!parse_json(deep, &v, &err), "strict: nesting limit");

  expect_true(parse_json(R"({"s": "caf\u00e9 \ud83d\ude00"})", &v, &err), "strict: unicode escapes");
  const JsonValue* s = v.find("s");
  expect_true(s && s->string == "caf\xc3\xa9 \xf0\x9f\x98\x80", "strict: UTF-8 decoded incl. surrogate pair");
}

void test_response_round_trip() {
  AnalysisInput in;
  if (!parse_analysis_input_json(kDirectDoc, &in)) {
    fail("response: input parse");
    return;
  }
  const AnalysisResponse r = Analyzer().analyze(in.request, in.alternatives);
  const std::string out = analysis_response_to_json(r);

  JsonValue doc;
  JsonParseError err;
  expect_true(parse_json(out, &doc, &err), "response: output is valid JSON");
  expect_true(out.find("nan") == std::string::npos && out.find("inf") == std::string::npos,
              "response: no NaN/Inf tokens");

  const JsonValue* status = doc.find("status");
  expect_true(status && status->string == "success", "response: status success");
  const JsonValue* ahp = doc.find("ahp_diagnostics");
  expect_true(ahp && ahp->is_null(), "response: ahp_diagnostics null for direct");
  const JsonValue* ranking = doc.find("ranking");
  expect_true(ranking && ranking->is_array() && ranking->array.size() == 3, "response: three ranked");
  if (ranking && ranking->array.size() == 3) {
    const JsonValue* top = ranking->array[0].find("alternative_id");
    expect_true(top && top->string == "C", "response: C first");
    const JsonValue* rank = ranking->array[2].find("rank");
    expect_true(rank && rank->number == 3.0, "response: integer rank");
  }
  const JsonValue* errors = doc.find("validation_errors");
  expect_true(errors && errors->is_array() && errors->array.empty(), "response: empty errors array");

  JsonWriteOptions compact;
  compact.pretty = false;
  const std::string flat = analysis_response_to_json(r, compact);
  expect_true(flat.find('\n') == std::string::npos, "response: compact has no newlines");
  expect_true(analysis_response_to_json(r) == out, "response: deterministic");
}

void test_failed_response() {
  AnalysisInput in;
  if (!parse_analysis_input_json(kAhpDoc, &in)) {
    fail("failed response: input parse");
    return;
  }
  in.request.pairwise_comparisons.clear();
  const AnalysisResponse r = Analyzer().analyze(in.request, in.alternatives);

  JsonValue doc;
  expect_true(parse_json(analysis_response_to_json(r), &doc), "failed response: valid JSON");
  const JsonValue* stage = doc.find("failed_stage");
  expect_true(stage && stage->string == "validate", "failed response: stage");
  const JsonValue* ranking = doc.find("ranking");
  expect_true(ranking && ranking->array.empty(), "failed response: empty ranking");
  const JsonValue* errors = doc.find("validation_errors");
  expect_true(errors && errors->array.size() == 1, "failed response: one error");
}

void test_writer_non_finite() {
  std::ostringstream os;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(os, opt);
  w.begin_array();
  w.number(std::numeric_limits<double>::quiet_NaN());
  w.number(std::numeric_limits<double>::infinity());
  w.number(0.25);
  w.string("tab\there \"q\"");
  w.end_array();
  w.finish();
  expect_eq_str(os.str(), "[null,null,0.25,\"tab\\there \\\"q\\\"\"]", "writer: non-finite as null, escapes");
}

void test_csv() {
  expect_eq_str(csv_escape("plain"), "plain", "csv: plain untouched");
  expect_eq_str(csv_escape("a,b"), "\"a,b\"", "csv: delimiter quoted");
  expect_eq_str(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"", "csv: quotes doubled");
  expect_eq_str(csv_escape("a;b", ';'), "\"a;b\"", "csv: custom delimiter");

  TopsisResult r;
  r.alternative_id = "C";
  r.name = "Site, C";
  r.rank = 1;
  r.score = 0.5484642;
  r.distance_to_best = std::numeric_limits<double>::quiet_NaN();
  r.distance_to_worst = 0.25;
  expect_eq_str(ranking_csv_row(r), "1,C,\"Site, C\",0.548464,,0.250000", "csv: row with empty non-finite field");

  std::ostringstream os;
  CsvExportOptions opt;
  opt.include_header = true;
  write_ranking_csv(os, {r}, opt);
  expect_true(os.str().rfind("rank,alternative_id,name,score,distance_to_best,distance_to_worst\n", 0) == 0,
              "csv: header first");
}

}  // namespace

int main() {
  mcda::set_log_level(mcda::LogLevel::ERROR);

  test_parse_direct();
  test_parse_ahp();
  test_schema_errors();
  test_strict_json();
  test_response_round_trip();
  test_failed_response();
  test_writer_non_finite();
  test_csv();
  return mcda::selftest::finish();
}
