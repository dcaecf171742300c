#include "arm_angle/runner/process_runner.hpp"
#include "arm_angle/runner/stage_runner.hpp"
#include "arm_angle/store/unit_store.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

using arm_angle::Stage;
using arm_angle::runner::OutcomeKind;
using arm_angle::runner::StageRunner;
using arm_angle::store::Unit;
using arm_angle::store::UnitStore;
using arm_angle::test::TempDir;
using arm_angle::test::read_file;
using arm_angle::test::sh_stage;
using arm_angle::test::write_file;

namespace {

Unit first_unit(const UnitStore &store) {
  auto units = store.discover();
  REQUIRE(units.size() == 1);
  return units.front();
}

} // namespace

TEST_CASE("expand_command_substitutes_placeholders") {
  auto argv = arm_angle::runner::expand_command(
      {"tool", "--in={input}", "-o", "{output}", "--id", "{unit_id}", "{unit_dir}"},
      "/v/p1.mp4", "/v/p1/out", "p1", "/v/p1");
  REQUIRE(argv == std::vector<std::string>{"tool", "--in=/v/p1.mp4", "-o", "/v/p1/out",
                                           "--id", "p1", "/v/p1"});
}

TEST_CASE("expand_command_appends_input_and_output_when_unreferenced") {
  auto argv = arm_angle::runner::expand_command({"extract_frames", "--fps", "30"}, "in.mp4",
                                                "out", "p1", "/v/p1");
  REQUIRE(argv == std::vector<std::string>{"extract_frames", "--fps", "30", "in.mp4", "out"});
}

TEST_CASE("process_runner_captures_output_and_exit_code") {
  arm_angle::runner::ProcessRunner pr;
  auto r = pr.run({"/bin/sh", "-c", "echo hello; echo oops >&2; exit 3"}, 10000);
  REQUIRE(r.started);
  REQUIRE_FALSE(r.timed_out);
  REQUIRE(r.exit_code == 3);
  REQUIRE(r.output.find("hello") != std::string::npos);
  REQUIRE(r.output.find("oops") != std::string::npos);

  auto missing = pr.run({"/nonexistent/arm_angle_tool"}, 1000);
  REQUIRE_FALSE(missing.started);
  REQUIRE_FALSE(missing.error_message.empty());
}

TEST_CASE("successful_stage_publishes_output_and_writes_log") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::SUCCESS);
  REQUIRE(outcome.exit_code == 0);
  REQUIRE(store.is_complete(u, Stage::EXTRACT));
  REQUIRE_FALSE(fs::exists(store.staging_dir(u, Stage::EXTRACT, "run1")));

  const std::string log = read_file(store.log_dir(u) / "extract.log");
  REQUIRE(log.find("run1") != std::string::npos);
  REQUIRE(log.find("[exit 0]") != std::string::npos);
}

TEST_CASE("nonzero_exit_is_failure_and_keeps_staging_until_next_attempt") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command =
      sh_stage("printf 'half' > \"$2/frame_0001.jpg\"; echo decoder broke >&2; exit 2");
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner first(store, cfg, "run1");
  auto outcome = first.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::FAILURE);
  REQUIRE(outcome.exit_code == 2);
  REQUIRE(outcome.reason.find("decoder broke") != std::string::npos);
  REQUIRE_FALSE(fs::exists(store.stage_output_dir(u, Stage::EXTRACT)));
  REQUIRE(fs::exists(store.staging_dir(u, Stage::EXTRACT, "run1") / "frame_0001.jpg"));

  cfg.stages.extract.command = sh_stage(arm_angle::test::kExtractScript);
  StageRunner second(store, cfg, "run2");
  REQUIRE(second.run(u, Stage::EXTRACT).kind == OutcomeKind::SUCCESS);
  REQUIRE_FALSE(fs::exists(store.staging_dir(u, Stage::EXTRACT, "run1")));
}

TEST_CASE("exit_zero_without_marker_is_failure") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command = sh_stage("touch \"$2/manifest.json\"; exit 0");
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::FAILURE);
  REQUIRE(outcome.reason.find("marker") != std::string::npos);
  REQUIRE_FALSE(store.is_complete(u, Stage::EXTRACT));
}

TEST_CASE("stage_exceeding_timeout_is_killed") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command = sh_stage("sleep 30");
  cfg.stages.extract.timeout_seconds = 0.5;
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::TIMEOUT);
  REQUIRE(outcome.reason.find("timed out") != std::string::npos);
  REQUIRE(outcome.duration_ms < 10000.0);
  REQUIRE_FALSE(store.is_complete(u, Stage::EXTRACT));
}

TEST_CASE("missing_prerequisite_fails_without_invoking_command") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.label.command = sh_stage("touch \"$3/label_was_invoked\"");
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::LABEL);
  REQUIRE(outcome.kind == OutcomeKind::FAILURE);
  REQUIRE(outcome.reason.find("extract") != std::string::npos);
  REQUIRE_FALSE(fs::exists(u.dir / "label_was_invoked"));
}

TEST_CASE("missing_raw_artifact_fails_extract") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  write_file(tmp.path() / "p1" / "pitcher_labels" / "manifest.json", "ok");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);
  REQUIRE_FALSE(u.raw_present);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::FAILURE);
  REQUIRE(outcome.reason == "raw artifact missing");
}

TEST_CASE("forced_rerun_replaces_marker_content") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.command =
      sh_stage("n=$(cat \"$3/count\" 2>/dev/null || echo 0); n=$((n+1)); "
               "echo $n > \"$3/count\"; printf 'attempt %s' $n > \"$2/manifest.json\"");
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  REQUIRE(StageRunner(store, cfg, "run1").run(u, Stage::EXTRACT).ok());
  REQUIRE(read_file(store.marker_path(u, Stage::EXTRACT)) == "attempt 1");
  REQUIRE(StageRunner(store, cfg, "run2").run(u, Stage::EXTRACT).ok());
  REQUIRE(read_file(store.marker_path(u, Stage::EXTRACT)) == "attempt 2");
}

TEST_CASE("deleted_raw_with_complete_output_is_skipped_not_failed") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  write_file(tmp.path() / "p1" / "release_frames" / "manifest.json", "{\"frames\": 3}");
  write_file(tmp.path() / "p1" / "raw_artifact.json", "{\"name\": \"p1.mp4\"}");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);
  REQUIRE_FALSE(u.raw_present);

  StageRunner runner(store, cfg, "run1");
  auto outcome = runner.run(u, Stage::EXTRACT);
  REQUIRE(outcome.kind == OutcomeKind::SKIPPED);
  REQUIRE(outcome.reason == "raw deleted; derived output kept");
  REQUIRE(read_file(store.marker_path(u, Stage::EXTRACT)) == "{\"frames\": 3}");
}

TEST_CASE("timeout_beyond_int_milliseconds_is_clamped") {
  TempDir tmp;
  auto cfg = arm_angle::test::sh_config(tmp.path());
  cfg.stages.extract.timeout_seconds = 1e12;
  write_file(tmp.path() / "p1.mp4", "raw video");
  UnitStore store(tmp.path(), cfg);
  Unit u = first_unit(store);

  StageRunner runner(store, cfg, "run1");
  REQUIRE(runner.run(u, Stage::EXTRACT).kind == OutcomeKind::SUCCESS);
}
