#include "arm_angle/pipeline/orchestrator.hpp"
#include "arm_angle/analysis/export.hpp"
#include "arm_angle/analysis/ground_truth.hpp"
#include "arm_angle/analysis/histogram.hpp"
#include "arm_angle/analysis/observations.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace arm_angle::pipeline {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string format_duration(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ms / 1000.0 << "s";
    return oss.str();
}

} // namespace

void StageReport::record(const UnitStageResult& result) {
    ++considered;
    if (result.pending) {
        ++pending;
    } else {
        switch (result.outcome.kind) {
            case runner::OutcomeKind::SUCCESS: ++processed; break;
            case runner::OutcomeKind::SKIPPED: ++skipped; break;
            case runner::OutcomeKind::FAILURE: ++failed; break;
            case runner::OutcomeKind::TIMEOUT: ++timed_out; break;
        }
    }
    if (result.deletion) {
        if (result.deletion->kind == runner::DeleteKind::DELETED) ++deleted;
        if (result.deletion->kind == runner::DeleteKind::FAILED) ++delete_failed;
    }
}

bool StageReport::total_failure() const {
    return active && considered > 0 && failed + timed_out == considered;
}

std::string StageReport::status() const {
    if (!active) return "skipped";
    if (total_failure()) return "error";
    if (failed + timed_out > 0) return "partial";
    return "ok";
}

bool RunReport::total_stage_failure() const {
    for (const auto& s : stages) {
        if (s.total_failure()) return true;
    }
    return false;
}

Orchestrator::Orchestrator(const config::Config& cfg, RunOptions options,
                           core::EventEmitter& events, std::ostream& progress)
    : cfg_(cfg),
      options_(std::move(options)),
      events_(events),
      progress_(progress),
      store_(cfg.videos_dir(), cfg) {}

bool Orchestrator::stage_active(Stage stage) const {
    if (options_.skipped.count(stage)) return false;
    if (stage == Stage::EXPORT) return cfg_.stages.export_enabled;
    return cfg_.stages.get(stage).enabled;
}

bool Orchestrator::deletion_possible() const {
    if (options_.keep_raw || options_.dry_run) return false;
    for (Stage stage : kUnitStages) {
        if (stage_active(stage) && cfg_.stages.get(stage).delete_raw_on_success) return true;
    }
    return false;
}

fs::path Orchestrator::results_path() const {
    if (!options_.results_path.empty()) return options_.results_path;
    return cfg_.analysis_dir() / "results.csv";
}

void Orchestrator::preflight() const {
    if (!fs::is_directory(store_.root())) {
        throw ConfigError("Videos directory not found: " + store_.root().string());
    }

    for (Stage stage : kUnitStages) {
        if (!stage_active(stage)) continue;
        const auto& sc = cfg_.stages.get(stage);
        if (sc.command.empty()) {
            throw ConfigError("stage '" + stage_to_string(stage) + "' has no command");
        }
        if (!core::executable_exists(sc.command.front())) {
            throw ConfigError("executable for stage '" + stage_to_string(stage) +
                              "' not found: " + sc.command.front());
        }
    }

    if (stage_active(Stage::EXPORT)) {
        const fs::path gt = cfg_.ground_truth_path();
        if (!fs::is_regular_file(gt)) {
            throw ConfigError("Ground truth file not found: " + gt.string());
        }
        if (cfg_.plot.enabled && string_to_plot_format(cfg_.plot.format) == PlotFormat::PDF) {
            if (cfg_.plot.pdf_converter.empty() ||
                !core::executable_exists(cfg_.plot.pdf_converter.front())) {
                throw ConfigError("PDF plots need a converter; not found: " +
                                  (cfg_.plot.pdf_converter.empty()
                                       ? std::string("(empty plot.pdf_converter)")
                                       : cfg_.plot.pdf_converter.front()));
            }
        }
    }

    // id collisions surface here, before any unit is touched
    (void)store_.discover();
}

void Orchestrator::progress(Stage stage, const std::string& message) {
    progress_ << "[" << upper(stage_to_string(stage)) << "] " << message << std::endl;
}

RunReport Orchestrator::run() {
    RunReport report;
    report.run_id = events_.run_id();
    report.dry_run = options_.dry_run;

    std::vector<store::Unit> units = store_.discover();
    report.units_discovered = static_cast<int>(units.size());

    core::json active = core::json::array();
    for (Stage stage : kAllStages) {
        if (stage_active(stage)) active.push_back(stage_to_string(stage));
    }
    events_.run_start({{"videos_dir", store_.root().string()},
                       {"analysis_dir", cfg_.analysis_dir().string()},
                       {"units_discovered", units.size()},
                       {"stages", active},
                       {"force", options_.force},
                       {"keep_raw", options_.keep_raw},
                       {"dry_run", options_.dry_run}});
    for (const auto& notice : options_.notices) {
        events_.warning(notice);
    }

    const runner::StageRunner stage_runner(store_, cfg_, report.run_id);

    for (Stage stage : kUnitStages) {
        report.stages.push_back(run_unit_stage(stage, units, stage_runner, report));
    }
    report.stages.push_back(run_export(units, report));

    events_.run_end(!report.total_stage_failure(),
                    report.total_stage_failure() ? "error" : "ok",
                    {{"failures", report.failures.size()}});
    return report;
}

UnitStageResult Orchestrator::run_one(Stage stage, store::Unit& unit,
                                      const runner::StageRunner& stage_runner) {
    UnitStageResult r;
    r.unit_id = unit.id;
    r.stage = stage;
    r.decision = store_.decide(unit, stage, options_.force);

    if (r.decision == store::GateDecision::SKIP) {
        r.outcome.kind = runner::OutcomeKind::SKIPPED;
        r.outcome.reason = "marker complete";
    } else if (options_.dry_run) {
        r.pending = true;
        r.outcome.kind = runner::OutcomeKind::SKIPPED;
        r.outcome.reason = "dry run";
        return r;
    } else {
        r.outcome = stage_runner.run(unit, stage);
    }

    if (!options_.dry_run && cfg_.stages.get(stage).delete_raw_on_success &&
        unit.raw_present && !options_.keep_raw) {
        r.deletion = runner::maybe_delete_raw(store_, unit, stage, r.outcome, options_.keep_raw);
        if (r.deletion->kind == runner::DeleteKind::KEPT) r.deletion.reset();
    }
    return r;
}

StageReport Orchestrator::run_unit_stage(Stage stage, std::vector<store::Unit>& units,
                                         const runner::StageRunner& stage_runner, RunReport& report) {
    StageReport sr;
    sr.stage = stage;
    sr.active = stage_active(stage);
    if (!sr.active) {
        progress(stage, "skipped for this run");
        return sr;
    }

    const int total = static_cast<int>(units.size());
    events_.phase_start(stage, total);
    progress(stage, std::to_string(total) + " unit(s)");

    for (int i = 0; i < total; ++i) {
        store::Unit& unit = units[static_cast<size_t>(i)];
        UnitStageResult r;
        try {
            r = run_one(stage, unit, stage_runner);
        } catch (const std::exception& e) {
            r = UnitStageResult{};
            r.unit_id = unit.id;
            r.stage = stage;
            r.outcome.kind = runner::OutcomeKind::FAILURE;
            r.outcome.reason = e.what();
        }
        sr.record(r);

        std::string status = r.pending ? "pending" : runner::outcome_kind_to_string(r.outcome.kind);
        core::json extra = {{"decision", store::gate_decision_to_string(r.decision)},
                            {"duration_ms", r.outcome.duration_ms}};
        if (!r.outcome.reason.empty()) extra["reason"] = r.outcome.reason;
        if (r.outcome.exit_code >= 0) extra["exit_code"] = r.outcome.exit_code;
        if (r.deletion) {
            extra["raw_deletion"] = runner::delete_kind_to_string(r.deletion->kind);
            if (!r.deletion->reason.empty()) extra["delete_reason"] = r.deletion->reason;
        }
        events_.unit_processed(stage, i + 1, total, unit.id, status, extra);

        std::string line = unit.id + ": " + status;
        if (r.outcome.kind == runner::OutcomeKind::SUCCESS) {
            line += " (" + format_duration(r.outcome.duration_ms) + ")";
        } else if (!r.outcome.reason.empty() && !r.pending &&
                   r.outcome.kind != runner::OutcomeKind::SKIPPED) {
            line += ": " + r.outcome.reason;
        }
        if (r.deletion) {
            line += r.deletion->kind == runner::DeleteKind::DELETED
                        ? ", raw deleted"
                        : ", raw kept (" + r.deletion->reason + ")";
        }
        progress(stage, line);

        if (r.outcome.kind == runner::OutcomeKind::FAILURE ||
            r.outcome.kind == runner::OutcomeKind::TIMEOUT) {
            report.failures.push_back(
                {stage, unit.id, runner::outcome_kind_to_string(r.outcome.kind), r.outcome.reason});
        }
        if (r.deletion && r.deletion->kind == runner::DeleteKind::FAILED) {
            events_.warning("raw artifact of " + unit.id + " kept: " + r.deletion->reason);
            report.failures.push_back({stage, unit.id, "delete_failed", r.deletion->reason});
        }
    }

    events_.phase_end(stage, sr.status(),
                      {{"processed", sr.processed},
                       {"skipped", sr.skipped},
                       {"failed", sr.failed},
                       {"timed_out", sr.timed_out},
                       {"deleted", sr.deleted},
                       {"delete_failed", sr.delete_failed},
                       {"pending", sr.pending}});
    return sr;
}

StageReport Orchestrator::run_export(const std::vector<store::Unit>& units, RunReport& report) {
    StageReport sr;
    sr.stage = Stage::EXPORT;
    sr.active = stage_active(Stage::EXPORT);
    if (!sr.active) {
        progress(Stage::EXPORT, "skipped for this run");
        return sr;
    }

    events_.phase_start(Stage::EXPORT, static_cast<int>(units.size()));
    UnitStageResult r;
    r.unit_id = "*";
    r.stage = Stage::EXPORT;

    if (options_.dry_run) {
        r.pending = true;
        sr.record(r);
        progress(Stage::EXPORT, "dry run: would write " + results_path().string());
        events_.phase_end(Stage::EXPORT, "skipped", {{"reason", "dry_run"}});
        return sr;
    }

    try {
        const analysis::GroundTruthTable gt =
            analysis::load_ground_truth(cfg_.ground_truth_path(), cfg_.ground_truth);
        for (const auto& w : gt.warnings) events_.warning(w);

        std::vector<analysis::UnitObservations> observations;
        for (const auto& unit : units) {
            analysis::ObservationLoad load = analysis::load_observations(
                store_.stage_output_dir(unit, Stage::MEASURE), cfg_.aggregation.variants);
            for (const auto& w : load.warnings) {
                events_.warning(w);
                progress(Stage::EXPORT, "warning: " + w);
            }
            observations.push_back({unit.id, std::move(load.frames)});
        }

        const analysis::AggregationResult agg =
            analysis::aggregate(observations, gt, cfg_.aggregation);
        const analysis::ExportPaths paths =
            analysis::write_exports(agg, cfg_.aggregation, results_path());

        report.exported.written = true;
        report.exported.results_csv = paths.results_csv;
        report.exported.summary_csv = paths.summary_csv;
        report.exported.summary_json = paths.summary_json;
        report.exported.rows = agg.export_rows.size();
        report.exported.units_with_ground_truth = agg.units_with_ground_truth;
        report.exported.units_without_ground_truth =
            static_cast<int>(agg.units_without_ground_truth.size());

        if (!agg.units_without_ground_truth.empty()) {
            progress(Stage::EXPORT, std::to_string(agg.units_without_ground_truth.size()) +
                                        " unit(s) without ground truth excluded");
        }
        for (const auto& m : agg.summaries) {
            if (!m.has_data) {
                events_.warning("no data for variant " + m.variant_id);
            }
        }

        if (cfg_.plot.enabled) {
            report.exported.plots =
                analysis::write_error_histograms(agg, cfg_.plot, cfg_.analysis_dir() / "plots");
        }

        r.outcome.kind = runner::OutcomeKind::SUCCESS;
        progress(Stage::EXPORT, std::to_string(agg.export_rows.size()) + " row(s) -> " +
                                    paths.results_csv.string());
    } catch (const std::exception& e) {
        r.outcome.kind = runner::OutcomeKind::FAILURE;
        r.outcome.reason = e.what();
        events_.error(std::string("export failed: ") + e.what());
        progress(Stage::EXPORT, std::string("failed: ") + e.what());
        report.failures.push_back({Stage::EXPORT, "*", "failure", e.what()});
    }

    sr.record(r);
    events_.phase_end(Stage::EXPORT, sr.status(),
                      {{"rows", report.exported.rows},
                       {"results_csv", report.exported.results_csv.string()},
                       {"plots", report.exported.plots.size()}});
    return sr;
}

} // namespace arm_angle::pipeline
