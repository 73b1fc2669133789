#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "insight/audit.hpp"
#include "insight/config.hpp"
#include "insight/hash.hpp"
#include "insight/jsonlite.hpp"
#include "insight/observability.hpp"
#include "insight/pipeline.hpp"
#include "insight/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRejected = 2;

// Storage duration for datasets ingested by `run`.
constexpr uint64_t kRunStorageMs = insight::kMsPerDay;

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::stringstream ss;
  ss << ifs.rdbuf();
  *out = ss.str();
  return true;
}

void print(const insight::jsonlite::Object& o) { std::cout << insight::jsonlite::to_json(o) << "\n"; }

int rejected(insight::ErrorCode code, const std::string& detail) {
  insight::jsonlite::Object o;
  o["ok"] = false;
  o["error"] = insight::to_string(code);
  o["error_class"] = insight::to_string(insight::error_class(code));
  o["detail"] = detail;
  print(o);
  return kExitRejected;
}

int usage() {
  std::cerr << "usage: insight [--config <path>] <command> [args]\n"
               "  version\n"
               "  frameworks\n"
               "  requirements <framework>\n"
               "  evaluate <framework[,framework]> <metadata.json>\n"
               "  policies\n"
               "  budget <category>\n"
               "  reset <category>\n"
               "  ingest <file> <owner> <duration_s>\n"
               "  run <file> <category> <circuit> <epsilon> <metadata.json>\n"
               "  jobs\n"
               "  audit-verify <path>\n"
               "  audit\n"
               "  sweep\n"
               "  stats\n";
  return kExitUsage;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

bool load_metadata(const std::string& path, insight::jsonlite::Object* out, std::string* error) {
  std::string text;
  if (!read_file(path, &text)) {
    *error = "cannot read " + path;
    return false;
  }
  std::optional<insight::jsonlite::JsonError> err;
  *out = insight::jsonlite::parse(text, &err);
  if (err) {
    *error = err->code + ": " + err->message;
    return false;
  }
  return true;
}

bool parse_seconds(const std::string& s, uint64_t* out) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 12) return false;
  *out = std::stoull(s);
  return *out > 0;
}

insight::jsonlite::Object framework_summary(const insight::Framework& f) {
  insight::jsonlite::Object o;
  o["id"] = f.id;
  o["name"] = f.name;
  o["rules"] = static_cast<std::uint64_t>(f.rules.size());
  return o;
}

int run_job(insight::Pipeline& p, const std::vector<std::string>& args) {
  std::string bytes;
  if (!read_file(args[0], &bytes)) return rejected(insight::ErrorCode::unknown_handle, "cannot read " + args[0]);
  const std::string& category = args[1];
  const std::string& circuit = args[2];
  auto eps = insight::Epsilon::parse(args[3]);
  if (!eps) return rejected(insight::ErrorCode::invalid_epsilon, args[3]);
  insight::jsonlite::Object metadata;
  std::string err;
  if (!load_metadata(args[4], &metadata, &err)) return rejected(insight::ErrorCode::json_parse_error, err);

  if (!p.verifier()->has_circuit(circuit)) {
    insight::VerifyingKey vk;
    vk.key_material = "insight-reference:" + circuit;
    vk.public_input_arity = 2;
    insight::Outcome o = p.register_circuit(circuit, vk);
    if (!o.ok()) return rejected(o.error, o.detail);
  }

  auto ingested = p.possession()->ingest(bytes, "cli", insight::blake3_hex(""), kRunStorageMs);
  if (ingested.error != insight::ErrorCode::none && ingested.error != insight::ErrorCode::already_exists) {
    return rejected(ingested.error, ingested.detail);
  }

  insight::SubmitRequest req;
  req.requester = "cli";
  req.dataset = ingested.handle;
  req.category = category;
  req.circuit_id = circuit;
  req.epsilon = *eps;
  req.metadata = std::move(metadata);

  auto& coord = *p.coordinator();
  auto sub = coord.submit(req);
  if (!sub.ok()) {
    insight::jsonlite::Object o;
    o["ok"] = false;
    o["error"] = insight::to_string(sub.error);
    o["error_class"] = insight::to_string(insight::error_class(sub.error));
    o["detail"] = sub.detail;
    insight::jsonlite::Array results;
    for (const auto& r : sub.compliance) results.emplace_back(insight::compliance_result_to_json(r));
    o["compliance"] = std::move(results);
    print(o);
    return kExitRejected;
  }

  insight::Outcome begun = coord.begin_processing(sub.job_id);
  if (begun.ok()) {
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(p.config().processing_deadline_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      coord.poll_inflight();
      auto j = coord.job(sub.job_id);
      if (!j || insight::is_terminal(j->state)) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    coord.poll_inflight();
  }

  auto job = coord.job(sub.job_id);
  if (!job) return rejected(insight::ErrorCode::unknown_job, std::to_string(sub.job_id));
  insight::jsonlite::Object o;
  o["ok"] = job->state == insight::JobState::verified;
  o["job"] = insight::job_to_json(*job);
  if (auto st = coord.budget_status(category)) o["budget"] = insight::budget_status_to_json(*st);
  print(o);
  return job->state == insight::JobState::verified ? kExitOk : kExitRejected;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    if (a.rfind("--", 0) == 0) return usage();
    positional.push_back(a);
  }
  if (positional.empty()) return usage();
  const std::string cmd = positional.front();
  const std::vector<std::string> args(positional.begin() + 1, positional.end());

  // Commands that need no pipeline.
  if (cmd == "version") {
    std::cout << insight::version::manifest_to_json(insight::version::current_manifest()) << "\n";
    return kExitOk;
  }
  if (cmd == "audit-verify") {
    if (args.size() != 1) return usage();
    const auto rep = insight::verify_audit_chain(args[0]);
    insight::jsonlite::Object o;
    o["ok"] = rep.ok;
    o["entries"] = rep.entries;
    o["first_bad_sequence"] = rep.first_bad_sequence;
    o["last_digest"] = rep.last_digest;
    o["error"] = rep.error;
    o["file_digest"] = insight::hash_file_blake3(args[0]);
    print(o);
    return rep.ok ? kExitOk : kExitRejected;
  }

  static const char* const kKnown[] = {"frameworks", "requirements", "evaluate", "policies", "budget", "reset",
                                       "ingest",     "run",          "jobs",     "audit",    "sweep",  "stats"};
  bool known = false;
  for (const char* k : kKnown) known = known || cmd == k;
  if (!known) return usage();

  auto cfg = insight::load_config(config_path);
  if (cfg.error != insight::ErrorCode::none) return rejected(cfg.error, cfg.detail);
  auto opened = insight::Pipeline::open(cfg.config);
  if (opened.error != insight::ErrorCode::none) return rejected(opened.error, opened.detail);
  insight::Pipeline& p = *opened.pipeline;
  auto& coord = *p.coordinator();

  if (cmd == "frameworks") {
    insight::jsonlite::Array list;
    for (const auto& id : p.compliance()->framework_ids()) {
      if (auto f = p.compliance()->framework(id)) list.emplace_back(framework_summary(*f));
    }
    insight::jsonlite::Object o;
    o["frameworks"] = std::move(list);
    print(o);
    return kExitOk;
  }

  if (cmd == "requirements") {
    if (args.size() != 1) return usage();
    auto req = p.compliance()->requirements(args[0]);
    if (!req) return rejected(insight::ErrorCode::unknown_framework, args[0]);
    print(insight::requirements_to_json(*req));
    return kExitOk;
  }

  if (cmd == "evaluate") {
    if (args.size() != 2) return usage();
    insight::jsonlite::Object metadata;
    std::string err;
    if (!load_metadata(args[1], &metadata, &err)) return rejected(insight::ErrorCode::json_parse_error, err);
    const auto rep = p.compliance()->report(split_csv(args[0]), metadata);
    print(insight::compliance_report_to_json(rep));
    return rep.overall_compliance ? kExitOk : kExitRejected;
  }

  if (cmd == "policies") {
    insight::jsonlite::Array list;
    for (const auto& pol : coord.policies()) list.emplace_back(insight::policy_to_json(pol));
    insight::jsonlite::Object o;
    o["policies"] = std::move(list);
    print(o);
    return kExitOk;
  }

  if (cmd == "budget") {
    if (args.size() != 1) return usage();
    auto st = coord.budget_status(args[0]);
    if (!st) return rejected(insight::ErrorCode::unknown_category, args[0]);
    print(insight::budget_status_to_json(*st));
    return kExitOk;
  }

  if (cmd == "reset") {
    if (args.size() != 1) return usage();
    auto r = coord.reset_period(args[0]);
    if (r.error != insight::ErrorCode::none) return rejected(r.error, r.detail);
    print(insight::ledger_entry_to_json(r.entry));
    return kExitOk;
  }

  if (cmd == "ingest") {
    if (args.size() != 3) return usage();
    std::string bytes;
    if (!read_file(args[0], &bytes)) return rejected(insight::ErrorCode::unknown_handle, "cannot read " + args[0]);
    uint64_t seconds = 0;
    if (!parse_seconds(args[2], &seconds)) return usage();
    auto r = p.possession()->ingest(bytes, args[1], insight::blake3_hex(""), seconds * insight::kMsPerSecond);
    if (r.error != insight::ErrorCode::none) return rejected(r.error, r.detail);
    auto stats = p.possession()->stats(r.handle.digest);
    if (!stats) return rejected(insight::ErrorCode::unknown_handle, r.handle.digest);
    print(insight::storage_stats_to_json(*stats));
    return kExitOk;
  }

  if (cmd == "run") {
    if (args.size() != 5) return usage();
    return run_job(p, args);
  }

  if (cmd == "jobs") {
    insight::jsonlite::Array list;
    for (const auto& j : coord.jobs()) list.emplace_back(insight::job_to_json(j));
    insight::jsonlite::Object o;
    o["jobs"] = std::move(list);
    print(o);
    return kExitOk;
  }

  if (cmd == "audit") {
    print(insight::audit_report_to_json(coord.audit_report()));
    return kExitOk;
  }

  if (cmd == "sweep") {
    const auto sweep = coord.sweep_possession();
    insight::jsonlite::Object o;
    o["checked"] = static_cast<std::uint64_t>(sweep.checked);
    o["passed"] = static_cast<std::uint64_t>(sweep.passed);
    o["failed"] = static_cast<std::uint64_t>(sweep.failed);
    print(o);
    return sweep.failed == 0 ? kExitOk : kExitRejected;
  }

  // stats
  std::cout << insight::global_pipeline_stats().to_json() << "\n";
  return kExitOk;
}
