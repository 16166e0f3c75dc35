#include "frame_diff/config/configuration.hpp"
#include "frame_diff/core/errors.hpp"
#include "frame_diff/core/events.hpp"
#include "frame_diff/core/types.hpp"
#include "frame_diff/core/utils.hpp"
#include "frame_diff/io/fits_io.hpp"
#include "frame_diff/io/frame_loader.hpp"
#include "frame_diff/pipeline/orchestrator.hpp"
#include "frame_diff/report/export.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

namespace config = frame_diff::config;
namespace core = frame_diff::core;
namespace io = frame_diff::io;
namespace pipeline = frame_diff::pipeline;
namespace report = frame_diff::report;

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

struct DetectOptions {
  std::string config_path;
  std::string out_dir = "frame_diff_out";
  int workers = 0;
  bool write_differentials = false;
  bool write_zooms = false;
  bool checksums = false;
  std::vector<std::string> frames;
};

config::Config load_config_or_default(const std::string &path) {
  if (path.empty()) {
    return config::Config{};
  }
  return config::Config::load(path);
}

void print_summary(const std::vector<frame_diff::ComparisonResult> &results) {
  for (const auto &r : results) {
    if (!r.ok()) {
      std::cerr << "[DETECT] comparison " << r.pairing_index << " ("
                << report::frame_label(r.comparison_id)
                << ") skipped: " << r.error->message << std::endl;
      continue;
    }
    std::cerr << "[DETECT] comparison " << r.pairing_index << " ("
              << report::frame_label(r.reference_id) << " vs "
              << report::frame_label(r.comparison_id) << "): "
              << r.all_candidates.size() << " changes detected, "
              << r.promising_candidates.size() << " promising" << std::endl;
  }
}

int cmd_detect(const DetectOptions &opts) {
  config::Config cfg;
  try {
    cfg = load_config_or_default(opts.config_path);
    if (opts.workers > 0) {
      cfg.runtime.parallel_workers = opts.workers;
    }
    if (opts.write_differentials) {
      cfg.output.write_differentials = true;
    }
    if (opts.write_zooms) {
      cfg.output.write_zoom_windows = true;
    }
    cfg.validate();
  } catch (const frame_diff::FrameDiffError &e) {
    std::cerr << e.what() << std::endl;
    return kExitError;
  }

  const fs::path out_dir(opts.out_dir);
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Cannot create output directory " << out_dir << ": "
              << ec.message() << std::endl;
    return kExitError;
  }

  std::ofstream log_file(out_dir / "events.jsonl");
  if (!log_file) {
    std::cerr << "Cannot open event log in " << out_dir << std::endl;
    return kExitError;
  }
  TeeBuf tee(std::cout.rdbuf(), log_file.rdbuf());
  std::ostream events(&tee);

  frame_diff::RunContext context;
  context.run_id = core::get_run_id();
  context.signature = cfg.run.signature_prefix + "-" +
                      std::to_string(core::get_current_year());

  json frames_info = json::array();
  for (const auto &f : opts.frames) {
    json frame;
    frame["path"] = f;
    frame["file_name"] = fs::path(f).filename().string();
    if (opts.checksums) {
      const std::string digest = core::sha256_file(f);
      frame["sha256"] = digest.empty() ? json(nullptr) : json(digest);
    }
    frames_info.push_back(frame);
  }

  core::EventEmitter emitter;
  emitter.run_start(context.run_id,
                    {{"frames", frames_info},
                     {"n_frames", opts.frames.size()},
                     {"signature", context.signature},
                     {"out_dir", out_dir.string()},
                     {"suppression_sigma", cfg.detection.suppression_sigma},
                     {"detection_multiplier", cfg.detection.detection_multiplier},
                     {"promising_multiplier", cfg.detection.promising_multiplier},
                     {"parallel_workers", cfg.runtime.parallel_workers}},
                    events);

  for (const auto &f : opts.frames) {
    if (!io::is_fits_image_path(f)) {
      emitter.warning(context.run_id, "not a FITS extension: " + f, events);
    }
  }

  io::FitsFrameLoader loader;
  pipeline::PairwiseOrchestrator orchestrator(loader, cfg, context, emitter,
                                              events);

  std::vector<frame_diff::ComparisonResult> results;
  try {
    results = orchestrator.run(opts.frames);
  } catch (const frame_diff::UsageError &e) {
    emitter.error(context.run_id, e.what(), events);
    emitter.run_end(context.run_id, false, "usage_error", json::object(), events);
    std::cerr << e.what() << std::endl;
    return kExitUsage;
  } catch (const frame_diff::ReferenceLoadError &e) {
    emitter.error(context.run_id, e.what(), events);
    emitter.run_end(context.run_id, false, "error", json::object(), events);
    std::cerr << e.what() << std::endl;
    return kExitError;
  } catch (const std::exception &e) {
    emitter.error(context.run_id, e.what(), events);
    emitter.run_end(context.run_id, false, "error", json::object(), events);
    std::cerr << "Detection failed: " << e.what() << std::endl;
    return kExitError;
  }

  print_summary(results);

  int n_failed = 0;
  for (const auto &r : results) {
    if (!r.ok()) ++n_failed;
  }

  try {
    const fs::path results_path = out_dir / cfg.output.results_file;
    core::write_text(results_path,
                     report::results_to_json(results, context)
                         .dump(2, ' ', false, json::error_handler_t::replace));

    json exported = {{"results", results_path.string()}};
    if (cfg.output.write_differentials) {
      const auto paths = report::write_differentials(
          results, out_dir / "differentials", context);
      exported["differentials"] = paths.size();
    }
    if (cfg.output.write_zoom_windows) {
      const auto paths = report::write_zoom_windows(
          results, out_dir / "zooms", cfg.output.zoom_half_size);
      exported["zoom_windows"] = paths.size();
    }
    core::emit_event("export_end", context.run_id, exported, events);
  } catch (const std::exception &e) {
    emitter.error(context.run_id, e.what(), events);
    emitter.run_end(context.run_id, false, "error", json::object(), events);
    std::cerr << "Export failed: " << e.what() << std::endl;
    return kExitError;
  }

  emitter.run_end(context.run_id, true, n_failed == 0 ? "ok" : "partial",
                  {{"n_comparisons", results.size()}, {"n_failed", n_failed}},
                  events);
  return kExitOk;
}

int cmd_validate_config(const std::string &path) {
  json out;
  try {
    config::Config cfg = config::Config::load(path);
    cfg.validate();
    out["valid"] = true;
    out["errors"] = json::array();
  } catch (const frame_diff::FrameDiffError &e) {
    out["valid"] = false;
    out["errors"] = json::array({e.what()});
  }
  std::cout << out.dump(2) << std::endl;
  return out["valid"].get<bool>() ? kExitOk : kExitError;
}

int cmd_get_schema() {
  std::cout << config::get_schema_json() << std::endl;
  return kExitOk;
}

int cmd_print_default_config() {
  YAML::Emitter emitter;
  emitter << config::Config{}.to_yaml();
  std::cout << emitter.c_str() << std::endl;
  return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Frame-Diff: multi-temporal differential detection"};
  app.require_subcommand(1);

  DetectOptions detect_opts;
  auto detect_cmd = app.add_subcommand(
      "detect", "Compare the first frame against every later frame");
  detect_cmd->add_option("--config", detect_opts.config_path,
                         "Path to config.yaml (defaults when omitted)");
  detect_cmd->add_option("--out-dir", detect_opts.out_dir, "Output directory");
  detect_cmd->add_option("--workers", detect_opts.workers,
                         "Parallel pairings (overrides runtime.parallel_workers)");
  detect_cmd->add_flag("--write-differentials", detect_opts.write_differentials,
                       "Write each differential map as FITS");
  detect_cmd->add_flag("--write-zooms", detect_opts.write_zooms,
                       "Write a FITS crop around each promising candidate");
  detect_cmd->add_flag("--checksums", detect_opts.checksums,
                       "Record a SHA-256 of every input frame in run_start");
  detect_cmd->add_option("frames", detect_opts.frames,
                         "Reference frame followed by comparison frames");

  std::string validate_path;
  auto validate_cmd =
      app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--path", validate_path, "Path to config.yaml")
      ->required();

  auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");
  auto defaults_cmd =
      app.add_subcommand("print-default-config", "Print the default config as YAML");

  CLI11_PARSE(app, argc, argv);

  if (detect_cmd->parsed()) {
    return cmd_detect(detect_opts);
  }
  if (validate_cmd->parsed()) {
    return cmd_validate_config(validate_path);
  }
  if (schema_cmd->parsed()) {
    return cmd_get_schema();
  }
  if (defaults_cmd->parsed()) {
    return cmd_print_default_config();
  }

  std::cerr << app.help() << std::endl;
  return kExitUsage;
}
