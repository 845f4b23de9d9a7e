#include "engine/io/analysis_json.hpp"

#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

namespace mcda {
namespace {

bool schema_error(JsonParseError* err, std::string msg) {
  if (err) {
    err->message = std::move(msg);
    err->offset = 0;
    err->line = 1;
    err->col = 1;
  }
  return false;
}

bool read_string_array(const JsonValue& root, const char* k, bool required,
                       std::vector<std::string>& out, JsonParseError* err) {
  const JsonValue* v = root.find(k);
  if (!v) {
    if (required) return schema_error(err, std::string("Missing required field: ") + k);
    return true;
  }
  if (!v->is_array()) return schema_error(err, std::string(k) + " must be an array");
  out.clear();
  out.reserve(v->array.size());
  for (const auto& e : v->array) {
    if (!e.is_string()) return schema_error(err, std::string(k) + " elements must be strings");
    out.push_back(e.string);
  }
  return true;
}

bool read_weights(const JsonValue& root, std::map<std::string, double>& out, JsonParseError* err) {
  const JsonValue* v = root.find("weights");
  if (!v || v->is_null()) return true;
  if (!v->is_object()) return schema_error(err, "weights must be an object");
  for (const auto& [id, w] : v->object) {
    if (!w.is_number()) return schema_error(err, "weights." + id + " must be a number");
    out[id] = w.number;
  }
  return true;
}

bool read_comparisons(const JsonValue& root, std::vector<PairwiseComparison>& out, JsonParseError* err) {
  const JsonValue* v = root.find("pairwise_comparisons");
  if (!v || v->is_null()) return true;
  if (!v->is_array()) return schema_error(err, "pairwise_comparisons must be an array");

  out.reserve(v->array.size());
  for (std::size_t i = 0; i < v->array.size(); ++i) {
    const JsonValue& e = v->array[i];
    const std::string ctx = "pairwise_comparisons[" + std::to_string(i) + "]";
    if (!e.is_object()) return schema_error(err, ctx + " must be an object");

    const JsonValue* a = e.find("a");
    const JsonValue* b = e.find("b");
    const JsonValue* val = e.find("value");
    if (!a || !a->is_string()) return schema_error(err, ctx + ".a is required string");
    if (!b || !b->is_string()) return schema_error(err, ctx + ".b is required string");
    if (!val || !val->is_number()) return schema_error(err, ctx + ".value is required number");

    PairwiseComparison pc;
    pc.criterion_a = a->string;
    pc.criterion_b = b->string;
    pc.value = val->number;
    out.push_back(std::move(pc));
  }
  return true;
}

bool read_fuzzy(const JsonValue& root, std::map<std::string, TriangularWeight>& out, JsonParseError* err) {
  const JsonValue* v = root.find("fuzzy_weights");
  if (!v || v->is_null()) return true;
  if (!v->is_object()) return schema_error(err, "fuzzy_weights must be an object");
  for (const auto& [id, tri] : v->object) {
    if (!tri.is_array() || tri.array.size() != 3 || !tri.array[0].is_number() || !tri.array[1].is_number() ||
        !tri.array[2].is_number()) {
      return schema_error(err, "fuzzy_weights." + id + " must be [low, mid, high]");
    }
    out[id] = TriangularWeight{tri.array[0].number, tri.array[1].number, tri.array[2].number};
  }
  return true;
}

bool read_alternatives(const JsonValue& root, std::vector<Alternative>& out, JsonParseError* err) {
  const JsonValue* v = root.find("alternatives");
  if (!v || v->is_null()) return true;
  if (!v->is_array()) return schema_error(err, "alternatives must be an array");

  out.reserve(v->array.size());
  for (std::size_t i = 0; i < v->array.size(); ++i) {
    const JsonValue& e = v->array[i];
    const std::string ctx = "alternatives[" + std::to_string(i) + "]";
    if (!e.is_object()) return schema_error(err, ctx + " must be an object");

    Alternative alt;
    const JsonValue* id = e.find("id");
    if (!id || !id->is_string() || id->string.empty()) return schema_error(err, ctx + ".id is required string");
    alt.id = id->string;

    const JsonValue* name = e.find("name");
    if (name && !name->is_null() && !name->is_string()) return schema_error(err, ctx + ".name must be a string");
    alt.name = (name && name->is_string()) ? name->string : alt.id;

    const JsonValue* values = e.find("values");
    if (values && !values->is_null()) {
      if (!values->is_object()) return schema_error(err, ctx + ".values must be an object");
      for (const auto& [cid, x] : values->object) {
        if (x.is_null()) continue;
        if (!x.is_number()) return schema_error(err, ctx + ".values." + cid + " must be a number or null");
        alt.values[cid] = x.number;
      }
    }
    out.push_back(std::move(alt));
  }
  return true;
}

void write_weight_map(JsonWriter& w, const std::map<std::string, double>& m) {
  w.begin_object();
  for (const auto& [id, x] : m) {
    w.key(id);
    w.number(x);
  }
  w.end_object();
}

void write_ahp(JsonWriter& w, const AhpResult& a) {
  w.begin_object();
  w.key("consistency_ratio");  w.number(a.consistency_ratio);
  w.key("is_consistent");      w.boolean(a.is_consistent);
  w.key("lambda_max");         w.number(a.lambda_max);
  w.key("consistency_index");  w.number(a.consistency_index);
  w.end_object();
}

void write_criteria(JsonWriter& w, const std::vector<Criterion>& criteria) {
  w.begin_array();
  for (const auto& c : criteria) {
    w.begin_object();
    w.key("id");        w.string(c.id);
    w.key("name");      w.string(c.name);
    w.key("direction"); w.string(to_string(c.direction));
    w.key("weight");    w.number(c.weight);
    w.key("unit");      w.string(c.unit);
    w.end_object();
  }
  w.end_array();
}

void write_ranking(JsonWriter& w, const std::vector<TopsisResult>& ranking) {
  w.begin_array();
  for (const auto& r : ranking) {
    w.begin_object();
    w.key("alternative_id");    w.string(r.alternative_id);
    w.key("name");              w.string(r.name);
    w.key("score");             w.number(r.score);
    w.key("rank");              w.integer(r.rank);
    w.key("distance_to_best");  w.number(r.distance_to_best);
    w.key("distance_to_worst"); w.number(r.distance_to_worst);
    w.end_object();
  }
  w.end_array();
}

}  // namespace

bool parse_analysis_input_json(std::string_view json, AnalysisInput* out, JsonParseError* err) {
  if (!out) return false;

  JsonValue root;
  if (!parse_json(json, &root, err)) return false;
  if (!root.is_object()) return schema_error(err, "Root must be an object");

  AnalysisInput in;

  const JsonValue* method = root.find("method");
  if (method && !method->is_null()) {
    if (!method->is_string()) return schema_error(err, "method must be a string");
    if (!parse_weighting_method(method->string, in.request.method)) {
      return schema_error(err, "Unknown method: " + method->string);
    }
  }

  if (!read_string_array(root, "criteria", true, in.request.criteria, err)) return false;
  if (!read_weights(root, in.request.weights, err)) return false;
  if (!read_comparisons(root, in.request.pairwise_comparisons, err)) return false;
  if (!read_fuzzy(root, in.fuzzy_weights, err)) return false;
  if (!read_alternatives(root, in.alternatives, err)) return false;

  if (root.find("alternative_ids")) {
    if (!read_string_array(root, "alternative_ids", false, in.request.alternative_ids, err)) return false;
  } else {
    for (const auto& a : in.alternatives) in.request.alternative_ids.push_back(a.id);
  }

  *out = std::move(in);
  return true;
}

bool parse_analysis_input_json(std::istream& is, AnalysisInput* out, JsonParseError* err) {
  std::ostringstream ss;
  ss << is.rdbuf();
  const std::string buf = ss.str();
  return parse_analysis_input_json(std::string_view(buf), out, err);
}

void write_analysis_response_json(std::ostream& os, const AnalysisResponse& r, const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);

  // Stable key order for deterministic diffs.
  w.begin_object();
  w.key("method");       w.string(to_string(r.method));
  w.key("status");       w.string(to_string(r.status));
  w.key("failed_stage"); w.string(to_string(r.failed_stage));

  w.key("ranking");
  write_ranking(w, r.ranking);

  w.key("resolved_weights");
  write_weight_map(w, r.resolved_weights);

  w.key("criteria");
  write_criteria(w, r.criteria);

  w.key("ahp_diagnostics");
  if (r.ahp) write_ahp(w, *r.ahp);
  else w.null_value();

  w.key("validation_errors");
  w.begin_array();
  for (const auto& e : r.validation_errors) w.string(e);
  w.end_array();

  w.end_object();
  w.finish();
}

std::string analysis_response_to_json(const AnalysisResponse& r, const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_analysis_response_json(ss, r, opt);
  return ss.str();
}

void write_robustness_json(std::ostream& os,
                           const std::vector<Alternative>& alternatives,
                           const SensitivityReport& sens,
                           const Diagnostics& diag,
                           const FuzzyReport* fuzzy,
                           const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  w.begin_object();

  w.key("base_scores");
  w.begin_object();
  for (std::size_t i = 0; i < alternatives.size() && i < sens.base_scores.size(); ++i) {
    w.key(alternatives[i].id);
    w.number(sens.base_scores[i]);
  }
  w.end_object();
  w.key("base_top_alternative"); w.string(sens.base_top_alternative);

  w.key("weight_sensitivity");
  w.begin_array();
  for (const auto& p : sens.points) {
    w.begin_object();
    w.key("criterion");             w.string(p.criterion_id);
    w.key("factor");                w.number(p.factor);
    w.key("mean_abs_score_change"); w.number(p.mean_abs_score_change);
    w.key("rank_correlation");      w.number(p.rank_correlation);
    w.key("top_alternative");       w.string(p.top_alternative);
    w.key("top_changed");           w.boolean(p.top_changed);
    w.key("weights");
    write_weight_map(w, p.weights);
    w.end_object();
  }
  w.end_array();

  w.key("max_score_change_by_criterion");
  write_weight_map(w, sens.max_score_change_by_criterion());

  w.key("diagnostics");
  w.begin_object();
  w.key("criteria");
  w.begin_array();
  for (const auto& c : diag.criteria) {
    w.begin_object();
    w.key("criterion");                w.string(c.criterion_id);
    w.key("mean");                     w.number(c.mean);
    w.key("stddev");                   w.number(c.stddev);
    w.key("coefficient_of_variation"); w.number(c.coefficient_of_variation);
    w.end_object();
  }
  w.end_array();
  w.key("scores");
  w.begin_object();
  w.key("mean");   w.number(diag.scores.mean);
  w.key("stddev"); w.number(diag.scores.stddev);
  w.key("min");    w.number(diag.scores.min);
  w.key("max");    w.number(diag.scores.max);
  w.key("range");  w.number(diag.scores.range);
  w.end_object();
  w.end_object();

  w.key("fuzzy");
  if (!fuzzy) {
    w.null_value();
  } else {
    w.begin_object();
    w.key("crisp_weights");
    write_weight_map(w, fuzzy->crisp_weights);
    w.key("crisp_ranking");
    write_ranking(w, fuzzy->crisp_ranking);
    w.key("ranges");
    w.begin_array();
    for (const auto& r : fuzzy->ranges) {
      w.begin_object();
      w.key("alternative_id"); w.string(r.alternative_id);
      w.key("crisp_score");    w.number(r.crisp_score);
      w.key("min_score");      w.number(r.min_score);
      w.key("max_score");      w.number(r.max_score);
      w.end_object();
    }
    w.end_array();
    w.end_object();
  }

  w.end_object();
  w.finish();
}

void write_monte_carlo_json(std::ostream& os, const MonteCarloReport& mc, const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  w.begin_object();
  w.key("samples_requested"); w.integer(static_cast<std::int64_t>(mc.samples_requested));
  w.key("samples_ok");        w.integer(static_cast<std::int64_t>(mc.samples_ok));
  w.key("samples_failed");    w.integer(static_cast<std::int64_t>(mc.samples_failed));
  w.key("seed");              w.string(std::to_string(mc.seed));
  w.key("top_k");             w.integer(static_cast<std::int64_t>(mc.top_k));

  w.key("alternatives");
  w.begin_array();
  for (const auto& a : mc.alternatives) {
    w.begin_object();
    w.key("alternative_id"); w.string(a.alternative_id);
    w.key("name");           w.string(a.name);
    w.key("mean_score");     w.number(a.mean_score);
    w.key("std_score");      w.number(a.std_score);
    w.key("p025");           w.number(a.p025);
    w.key("p975");           w.number(a.p975);
    w.key("mean_rank");      w.number(a.mean_rank);
    w.key("p_rank1");        w.number(a.p_rank1);
    w.key("p_top_k");        w.number(a.p_top_k);
    w.end_object();
  }
  w.end_array();

  w.key("robust_ranking");
  w.begin_array();
  for (const auto& id : mc.robust_ranking) w.string(id);
  w.end_array();

  w.end_object();
  w.finish();
}

}  // namespace mcda
