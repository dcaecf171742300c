#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/events.hpp"
#include "arm_angle/pipeline/orchestrator.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

namespace fs = std::filesystem;

using arm_angle::Stage;
using arm_angle::config::Config;
using arm_angle::core::EventEmitter;
using arm_angle::pipeline::Orchestrator;
using arm_angle::pipeline::RunOptions;
using arm_angle::pipeline::RunReport;
using arm_angle::pipeline::StageReport;
using arm_angle::test::TempDir;
using arm_angle::test::read_file;
using arm_angle::test::sh_stage;
using arm_angle::test::write_file;

namespace {

RunReport run_pipeline(const Config &cfg, RunOptions options = {},
                       std::string *events_out = nullptr) {
  std::ostringstream events;
  std::ostringstream progress;
  EventEmitter emitter("test_run", events);
  Orchestrator orchestrator(cfg, options, emitter, progress);
  orchestrator.preflight();
  RunReport report = orchestrator.run();
  if (events_out)
    *events_out = events.str();
  return report;
}

const StageReport &stage_report(const RunReport &report, Stage stage) {
  return report.stages.at(static_cast<size_t>(arm_angle::stage_to_int(stage)));
}

void make_videos(const fs::path &dir) {
  write_file(dir / "p1.mp4", "raw video one");
  write_file(dir / "p2.mp4", "raw video two");
  write_file(dir / "p2" / "angles.txt", "70.5\n");
  write_file(dir / "ground_truth.csv", "PitchId,Pitcher,ArmAngle\np1,Smith,82\np2,Jones,75\n");
}

} // namespace

TEST_CASE("full_run_processes_every_stage_and_second_run_skips_all") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());

  std::string events;
  RunReport first = run_pipeline(cfg, {}, &events);
  REQUIRE(first.exit_code() == 0);
  REQUIRE(first.failures.empty());
  REQUIRE(stage_report(first, Stage::EXTRACT).processed == 2);
  REQUIRE(stage_report(first, Stage::EXTRACT).deleted == 2);
  REQUIRE(stage_report(first, Stage::LABEL).processed == 2);
  REQUIRE(stage_report(first, Stage::MEASURE).processed == 2);
  REQUIRE(stage_report(first, Stage::EXPORT).processed == 1);
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1.mp4"));
  REQUIRE(fs::exists(tmp.path() / "p1" / "raw_artifact.json"));
  REQUIRE(events.find("\"type\":\"run_start\"") != std::string::npos);
  REQUIRE(events.find("\"type\":\"run_end\"") != std::string::npos);

  const fs::path results = tmp.path() / "data_analysis" / "results.csv";
  const std::string csv = read_file(results);
  REQUIRE(csv.rfind("video_id,frame_name,pitcher_angle_shoulder_wrist,"
                    "pitcher_angle_elbow_wrist,ground_truth_angle\n",
                    0) == 0);
  REQUIRE(csv.find("p1,frame_0001,80.000,N/A,82.000\n") != std::string::npos);
  REQUIRE(csv.find("p2,frame_0003,70.500,N/A,75.000\n") != std::string::npos);
  REQUIRE(fs::exists(tmp.path() / "data_analysis" / "summary.csv"));
  REQUIRE(fs::exists(tmp.path() / "data_analysis" / "summary.json"));

  RunReport second = run_pipeline(cfg);
  REQUIRE(second.exit_code() == 0);
  REQUIRE(second.units_discovered == 2);
  for (Stage stage : arm_angle::kUnitStages) {
    const StageReport &s = stage_report(second, stage);
    REQUIRE(s.skipped == 2);
    REQUIRE(s.processed == 0);
    REQUIRE(s.deleted == 0);
  }
  REQUIRE(read_file(results) == csv);
}

TEST_CASE("dry_run_reports_pending_work_and_touches_nothing") {
  TempDir tmp;
  make_videos(tmp.path());
  fs::remove_all(tmp.path() / "p2");
  Config cfg = arm_angle::test::sh_config(tmp.path());

  RunOptions options;
  options.dry_run = true;
  RunReport report = run_pipeline(cfg, options);
  REQUIRE(stage_report(report, Stage::EXTRACT).pending == 2);
  REQUIRE(stage_report(report, Stage::EXTRACT).processed == 0);
  REQUIRE(stage_report(report, Stage::EXPORT).pending == 1);
  REQUIRE(fs::exists(tmp.path() / "p1.mp4"));
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1"));
  REQUIRE_FALSE(fs::exists(tmp.path() / "data_analysis" / "results.csv"));
}

TEST_CASE("keep_raw_prevents_deletion") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());

  RunOptions options;
  options.keep_raw = true;
  RunReport report = run_pipeline(cfg, options);
  REQUIRE(stage_report(report, Stage::EXTRACT).processed == 2);
  REQUIRE(stage_report(report, Stage::EXTRACT).deleted == 0);
  REQUIRE(fs::exists(tmp.path() / "p1.mp4"));
  REQUIRE(fs::exists(tmp.path() / "p2.mp4"));
}

TEST_CASE("failed_stage_never_deletes_raw_and_is_partial") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command =
      sh_stage(std::string("[ \"$(basename \"$3\")\" = p2 ] && exit 4; ") +
               arm_angle::test::kExtractScript);

  RunReport report = run_pipeline(cfg);
  const StageReport &extract = stage_report(report, Stage::EXTRACT);
  REQUIRE(extract.processed == 1);
  REQUIRE(extract.failed == 1);
  REQUIRE(extract.deleted == 1);
  REQUIRE(fs::exists(tmp.path() / "p2.mp4"));
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1.mp4"));
  REQUIRE(stage_report(report, Stage::LABEL).failed == 1);
  REQUIRE(report.exit_code() == 0);

  bool listed = false;
  for (const auto &f : report.failures) {
    if (f.unit_id == "p2" && f.stage == Stage::EXTRACT && f.kind == "failure")
      listed = true;
  }
  REQUIRE(listed);
}

TEST_CASE("timeouts_for_every_unit_are_a_total_stage_failure") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command = sh_stage("sleep 30");
  cfg.stages.extract.timeout_seconds = 0.5;

  RunReport report = run_pipeline(cfg);
  REQUIRE(stage_report(report, Stage::EXTRACT).timed_out == 2);
  REQUIRE(stage_report(report, Stage::EXTRACT).deleted == 0);
  REQUIRE(stage_report(report, Stage::EXTRACT).total_failure());
  REQUIRE(report.exit_code() == 1);
  REQUIRE(fs::exists(tmp.path() / "p1.mp4"));
}

TEST_CASE("force_reruns_complete_units") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());
  RunOptions options;
  options.keep_raw = true;
  run_pipeline(cfg, options);

  options.force = true;
  RunReport forced = run_pipeline(cfg, options);
  for (Stage stage : arm_angle::kUnitStages) {
    REQUIRE(stage_report(forced, stage).processed == 2);
    REQUIRE(stage_report(forced, stage).skipped == 0);
  }
  const std::string log = read_file(tmp.path() / "p1" / ".logs" / "extract.log");
  size_t attempts = 0;
  for (size_t pos = log.find("=== "); pos != std::string::npos; pos = log.find("=== ", pos + 1))
    ++attempts;
  REQUIRE(attempts == 2);
}

TEST_CASE("complete_unit_with_raw_left_behind_is_deleted_on_resume") {
  TempDir tmp;
  make_videos(tmp.path());
  write_file(tmp.path() / "p1" / "release_frames" / "manifest.json", "{\"frames\": 3}");
  Config cfg = arm_angle::test::sh_config(tmp.path());

  RunOptions options;
  options.skipped = {Stage::LABEL, Stage::MEASURE, Stage::EXPORT};
  RunReport report = run_pipeline(cfg, options);
  const StageReport &extract = stage_report(report, Stage::EXTRACT);
  REQUIRE(extract.skipped == 1);
  REQUIRE(extract.processed == 1);
  REQUIRE(extract.deleted == 2);
  REQUIRE_FALSE(stage_report(report, Stage::LABEL).active);
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1.mp4"));
}

TEST_CASE("empty_marker_left_by_crash_is_reprocessed") {
  TempDir tmp;
  make_videos(tmp.path());
  write_file(tmp.path() / "p1" / "release_frames" / "manifest.json", "");
  write_file(tmp.path() / "p1" / "release_frames" / "frame_0001.jpg", "partial");
  Config cfg = arm_angle::test::sh_config(tmp.path());

  RunOptions options;
  options.skipped = {Stage::LABEL, Stage::MEASURE, Stage::EXPORT};
  options.keep_raw = true;
  RunReport report = run_pipeline(cfg, options);
  REQUIRE(stage_report(report, Stage::EXTRACT).processed == 2);
  REQUIRE(read_file(tmp.path() / "p1" / "release_frames" / "manifest.json") ==
          "{\"frames\": 3}");
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1" / "release_frames" / "frame_0001.jpg"));
}

TEST_CASE("preflight_rejects_missing_inputs_before_touching_units") {
  TempDir tmp;
  make_videos(tmp.path());
  std::ostringstream events;
  std::ostringstream progress;
  EventEmitter emitter("test_run", events);

  SECTION("missing executable") {
    Config cfg = arm_angle::test::sh_config(tmp.path());
    cfg.stages.label.command = {"/nonexistent/label_pitchers", "{input}", "{output}"};
    Orchestrator o(cfg, {}, emitter, progress);
    REQUIRE_THROWS_AS(o.preflight(), arm_angle::ConfigError);
  }
  SECTION("missing ground truth") {
    Config cfg = arm_angle::test::sh_config(tmp.path());
    fs::remove(tmp.path() / "ground_truth.csv");
    Orchestrator o(cfg, {}, emitter, progress);
    REQUIRE_THROWS_AS(o.preflight(), arm_angle::ConfigError);
  }
  SECTION("missing videos directory") {
    Config cfg = arm_angle::test::sh_config(tmp.path() / "nope");
    Orchestrator o(cfg, {}, emitter, progress);
    REQUIRE_THROWS_AS(o.preflight(), arm_angle::ConfigError);
  }
  SECTION("pdf plots without converter") {
    Config cfg = arm_angle::test::sh_config(tmp.path());
    cfg.plot.enabled = true;
    cfg.plot.format = "pdf";
    cfg.plot.pdf_converter = {"arm-angle-no-such-converter", "{input}", "{output}"};
    Orchestrator o(cfg, {}, emitter, progress);
    REQUIRE_THROWS_AS(o.preflight(), arm_angle::ConfigError);
  }
  REQUIRE(events.str().empty());
  REQUIRE(fs::exists(tmp.path() / "p1.mp4"));
}

TEST_CASE("deletion_possible_reflects_keep_raw_and_dry_run") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());
  std::ostringstream events;
  std::ostringstream progress;
  EventEmitter emitter("test_run", events);

  REQUIRE(Orchestrator(cfg, {}, emitter, progress).deletion_possible());

  RunOptions keep;
  keep.keep_raw = true;
  REQUIRE_FALSE(Orchestrator(cfg, keep, emitter, progress).deletion_possible());

  RunOptions dry;
  dry.dry_run = true;
  REQUIRE_FALSE(Orchestrator(cfg, dry, emitter, progress).deletion_possible());

  RunOptions no_extract;
  no_extract.skipped = {Stage::EXTRACT};
  REQUIRE_FALSE(Orchestrator(cfg, no_extract, emitter, progress).deletion_possible());
}

TEST_CASE("force_after_raw_deletion_keeps_derived_output") {
  TempDir tmp;
  make_videos(tmp.path());
  Config cfg = arm_angle::test::sh_config(tmp.path());

  std::string events;
  RunReport first = run_pipeline(cfg, {}, &events);
  REQUIRE(stage_report(first, Stage::EXTRACT).deleted == 2);
  REQUIRE(events.find("\"raw_deletion\":\"deleted\"") != std::string::npos);
  REQUIRE_FALSE(fs::exists(tmp.path() / "p1.mp4"));

  RunOptions options;
  options.force = true;
  RunReport forced = run_pipeline(cfg, options);
  REQUIRE(forced.exit_code() == 0);
  REQUIRE(forced.failures.empty());
  const StageReport &extract = stage_report(forced, Stage::EXTRACT);
  REQUIRE(extract.skipped == 2);
  REQUIRE(extract.processed == 0);
  REQUIRE(extract.failed == 0);
  REQUIRE(stage_report(forced, Stage::LABEL).processed == 2);
  REQUIRE(stage_report(forced, Stage::MEASURE).processed == 2);
  REQUIRE(fs::exists(tmp.path() / "p1" / "release_frames" / "manifest.json"));
  REQUIRE(fs::exists(tmp.path() / "p1" / "raw_artifact.json"));
}
