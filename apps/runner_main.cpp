#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/events.hpp"
#include "arm_angle/core/types.hpp"
#include "arm_angle/core/utils.hpp"
#include "arm_angle/pipeline/orchestrator.hpp"
#include "arm_angle/store/unit_store.hpp"

#include "runner_shared.hpp"

#include <QCoreApplication>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

using arm_angle::Stage;
namespace config = arm_angle::config;
namespace core = arm_angle::core;
namespace pipeline = arm_angle::pipeline;
namespace runner = arm_angle::runner;
namespace store = arm_angle::store;

struct RunArgs {
  std::string config_path;
  std::string videos_dir;
  std::string ground_truth;
  std::string output;
  bool skip_extract = false;
  bool skip_label = false;
  bool skip_measure = false;
  bool skip_export = false;
  bool force = false;
  bool keep_raw = false;
  double timeout = 0.0;
  bool plot = false;
  std::string plot_format;
  int bins = 0;
  double bin_width = 0.0;
  bool dry_run = false;
  bool yes = false;
  bool events_stdout = false;
};

config::Config load_config(const std::string &config_path,
                           const std::string &videos_dir) {
  config::Config cfg;
  if (!config_path.empty()) {
    cfg = config::Config::load(config_path);
  }
  if (!videos_dir.empty()) {
    cfg.paths.videos_dir = videos_dir;
  }
  return cfg;
}

int run_command(const RunArgs &args) {
  config::Config cfg = load_config(args.config_path, args.videos_dir);
  pipeline::RunOptions options;

  if (!args.ground_truth.empty())
    cfg.paths.ground_truth = args.ground_truth;
  if (args.timeout > 0.0) {
    cfg.runtime.stage_timeout_seconds = args.timeout;
    for (Stage stage : arm_angle::kUnitStages)
      cfg.stages.get(stage).timeout_seconds = 0.0;
  }
  if (args.plot)
    cfg.plot.enabled = true;
  if (!args.plot_format.empty())
    cfg.plot.format = args.plot_format;
  if (args.bins > 0)
    cfg.plot.bins = args.bins;
  if (args.bin_width > 0.0)
    cfg.plot.bin_width = args.bin_width;
  if (args.bins > 0 && args.bin_width > 0.0) {
    options.notices.push_back("both --bins and --bin-width given; using bin width " +
                              std::to_string(args.bin_width));
  }

  auto skip = [&](bool flag, Stage stage) {
    if (!flag)
      return;
    options.skipped.insert(stage);
    if (stage == Stage::EXPORT)
      cfg.stages.export_enabled = false;
    else
      cfg.stages.get(stage).enabled = false;
  };
  skip(args.skip_extract, Stage::EXTRACT);
  skip(args.skip_label, Stage::LABEL);
  skip(args.skip_measure, Stage::MEASURE);
  skip(args.skip_export, Stage::EXPORT);

  options.force = args.force;
  options.keep_raw = args.keep_raw;
  options.dry_run = args.dry_run;
  if (!args.output.empty())
    options.results_path = args.output;

  cfg.validate();

  const std::string run_id = core::get_run_id();

  // Bound to the event log once the startup checks pass.
  std::ostream log_stream(nullptr);
  core::EventEmitter emitter(run_id, log_stream);
  pipeline::Orchestrator orchestrator(cfg, options, emitter, std::cerr);
  orchestrator.preflight();

  if (orchestrator.deletion_possible() && !args.yes && ::isatty(STDIN_FILENO)) {
    if (!runner::confirm_deletion(std::cin, std::cerr)) {
      std::cerr << "Aborted: raw deletion not confirmed (use --keep-raw or --yes)"
                << std::endl;
      return 1;
    }
  }

  const fs::path logs_dir = cfg.analysis_dir() / "logs";
  fs::create_directories(logs_dir);
  std::ofstream event_log_file(logs_dir / "run_events.jsonl", std::ios::app);
  if (!event_log_file) {
    throw arm_angle::IOError("Cannot open event log in " + logs_dir.string());
  }
  runner::TeeBuf tee_buf(args.events_stdout ? std::cout.rdbuf() : nullptr,
                         event_log_file.rdbuf());
  log_stream.rdbuf(&tee_buf);

  if (!args.dry_run) {
    cfg.save(logs_dir / ("config_" + run_id + ".yaml"));
  }

  std::ostream &human = args.events_stdout ? std::cerr : std::cout;
  human << "Run ID: " << run_id << std::endl;
  human << "Videos: " << cfg.videos_dir().string() << std::endl;

  const pipeline::RunReport report = orchestrator.run();
  runner::print_run_report(report, human);

  log_stream.flush();
  log_stream.rdbuf(nullptr);
  return report.exit_code();
}

int status_command(const std::string &config_path,
                   const std::string &videos_dir) {
  const config::Config cfg = load_config(config_path, videos_dir);
  const store::UnitStore unit_store(cfg.videos_dir(), cfg);
  const auto units = unit_store.discover();
  runner::print_status_table(unit_store, units, std::cout);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qapp(argc, argv); // QProcess needs an application instance

  CLI::App app{"Arm-Angle Pipeline Runner"};
  app.require_subcommand(1);

  RunArgs args;
  auto run_cmd = app.add_subcommand("run", "Run the pipeline over every video");
  run_cmd->add_option("--config", args.config_path, "Path to config.yaml");
  run_cmd->add_option("--videos-dir", args.videos_dir,
                      "Directory holding raw videos and unit directories");
  run_cmd->add_option("--ground-truth", args.ground_truth,
                      "Ground truth CSV");
  run_cmd->add_option("--output", args.output,
                      "results.csv path (summaries are written beside it)");
  run_cmd->add_flag("--skip-extract", args.skip_extract, "Skip frame extraction");
  run_cmd->add_flag("--skip-label", args.skip_label, "Skip pose labeling");
  run_cmd->add_flag("--skip-measure", args.skip_measure,
                    "Skip arm angle measurement");
  run_cmd->add_flag("--skip-export", args.skip_export,
                    "Skip result export and summaries");
  run_cmd->add_flag("--force", args.force,
                    "Re-run stages even when their marker is complete");
  run_cmd->add_flag("--keep-raw", args.keep_raw, "Never delete raw videos");
  run_cmd->add_option("--timeout", args.timeout,
                      "Per-stage timeout in seconds")
      ->check(CLI::Range(0.001, config::kMaxStageTimeoutSeconds));
  run_cmd->add_flag("--plot", args.plot, "Write error histograms");
  run_cmd->add_option("--plot-format", args.plot_format,
                      "Histogram format: png|svg|pdf|jpg")
      ->check(CLI::IsMember({"png", "svg", "pdf", "jpg", "jpeg"}, CLI::ignore_case));
  run_cmd->add_option("--bins", args.bins, "Number of histogram bins")
      ->check(CLI::Range(1, config::kMaxHistogramBins));
  run_cmd->add_option("--bin-width", args.bin_width,
                      "Histogram bin width in degrees (overrides --bins)")
      ->check(CLI::PositiveNumber);
  run_cmd->add_flag("--dry-run", args.dry_run,
                    "Report what would run without running it");
  run_cmd->add_flag("--yes", args.yes, "Do not ask before deleting raw videos");
  run_cmd->add_flag("--events-stdout", args.events_stdout,
                    "Also write JSON events to stdout");

  std::string status_config_path, status_videos_dir;
  auto status_cmd =
      app.add_subcommand("status", "Show the lifecycle state of every unit");
  status_cmd->add_option("--config", status_config_path, "Path to config.yaml");
  status_cmd->add_option("--videos-dir", status_videos_dir,
                         "Directory holding raw videos and unit directories");

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return run_command(args);
    }
    if (status_cmd->parsed()) {
      return status_command(status_config_path, status_videos_dir);
    }
  } catch (const arm_angle::ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const arm_angle::ValidationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
