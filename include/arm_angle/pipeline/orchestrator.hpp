#pragma once

#include "arm_angle/analysis/aggregation.hpp"
#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/events.hpp"
#include "arm_angle/core/types.hpp"
#include "arm_angle/runner/safe_delete.hpp"
#include "arm_angle/runner/stage_runner.hpp"
#include "arm_angle/store/unit_store.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace arm_angle::pipeline {

namespace fs = std::filesystem;

struct RunOptions {
    bool force = false;
    bool keep_raw = false;
    bool dry_run = false;
    std::set<Stage> skipped;      // removed for this invocation
    fs::path results_path;        // empty = <analysis_dir>/results.csv
    std::vector<std::string> notices; // emitted as warnings when the run starts
};

struct UnitStageResult {
    std::string unit_id;
    Stage stage = Stage::EXTRACT;
    store::GateDecision decision = store::GateDecision::RUN;
    runner::StageOutcome outcome;
    std::optional<runner::DeleteOutcome> deletion;
    bool pending = false; // dry run: would have run
};

struct FailureRecord {
    Stage stage = Stage::EXTRACT;
    std::string unit_id;
    std::string kind;
    std::string reason;
};

// Per-stage accumulator; skips never count as processed.
struct StageReport {
    Stage stage = Stage::EXTRACT;
    bool active = false;
    int considered = 0;
    int processed = 0;
    int skipped = 0;
    int failed = 0;
    int timed_out = 0;
    int deleted = 0;
    int delete_failed = 0;
    int pending = 0;

    void record(const UnitStageResult& result);

    // every considered unit ended in FAILURE or TIMEOUT
    bool total_failure() const;
    std::string status() const;
};

struct ExportSummary {
    bool written = false;
    fs::path results_csv;
    fs::path summary_csv;
    fs::path summary_json;
    std::vector<fs::path> plots;
    size_t rows = 0;
    int units_with_ground_truth = 0;
    int units_without_ground_truth = 0;
};

struct RunReport {
    std::string run_id;
    bool dry_run = false;
    int units_discovered = 0;
    std::vector<StageReport> stages; // fixed stage order
    std::vector<FailureRecord> failures;
    ExportSummary exported;

    bool total_stage_failure() const;
    int exit_code() const { return total_stage_failure() ? 1 : 0; }
};

// Drives the fixed stage sequence over every discovered unit.
class Orchestrator {
public:
    Orchestrator(const config::Config& cfg, RunOptions options, core::EventEmitter& events,
                 std::ostream& progress);

    // Startup checks; throws ConfigError before any unit is touched.
    void preflight() const;

    bool stage_active(Stage stage) const;

    // Raw artifacts could be deleted by this invocation.
    bool deletion_possible() const;

    fs::path results_path() const;

    RunReport run();

private:
    StageReport run_unit_stage(Stage stage, std::vector<store::Unit>& units,
                               const runner::StageRunner& stage_runner, RunReport& report);
    UnitStageResult run_one(Stage stage, store::Unit& unit, const runner::StageRunner& stage_runner);
    StageReport run_export(const std::vector<store::Unit>& units, RunReport& report);

    void progress(Stage stage, const std::string& message);

    const config::Config& cfg_;
    RunOptions options_;
    core::EventEmitter& events_;
    std::ostream& progress_;
    store::UnitStore store_;
};

} // namespace arm_angle::pipeline
