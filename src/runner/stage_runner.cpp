#include "arm_angle/runner/stage_runner.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace arm_angle::runner {

namespace {

constexpr size_t kReasonTailChars = 400;

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(seconds < 10.0 ? 1 : 0) << seconds << "s";
    return oss.str();
}

StageOutcome make_outcome(OutcomeKind kind, std::string reason, int exit_code = -1,
                          double duration_ms = 0.0) {
    StageOutcome o;
    o.kind = kind;
    o.reason = std::move(reason);
    o.exit_code = exit_code;
    o.duration_ms = duration_ms;
    return o;
}

} // namespace

std::string outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS: return "success";
        case OutcomeKind::FAILURE: return "failure";
        case OutcomeKind::TIMEOUT: return "timeout";
        case OutcomeKind::SKIPPED: return "skipped";
        default: return "unknown";
    }
}

std::vector<std::string> expand_command(const std::vector<std::string>& command,
                                        const std::string& input,
                                        const std::string& output,
                                        const std::string& unit_id,
                                        const std::string& unit_dir) {
    bool references_io = false;
    std::vector<std::string> argv;
    argv.reserve(command.size() + 2);
    for (const auto& arg : command) {
        if (arg.find("{input}") != std::string::npos ||
            arg.find("{output}") != std::string::npos) {
            references_io = true;
        }
        std::string a = core::replace_all(arg, "{input}", input);
        a = core::replace_all(a, "{output}", output);
        a = core::replace_all(a, "{unit_id}", unit_id);
        a = core::replace_all(a, "{unit_dir}", unit_dir);
        argv.push_back(std::move(a));
    }
    if (!references_io) {
        argv.push_back(input);
        argv.push_back(output);
    }
    return argv;
}

StageRunner::StageRunner(const store::UnitStore& store, const config::Config& cfg,
                         std::string run_id)
    : store_(store), cfg_(cfg), run_id_(std::move(run_id)) {}

StageOutcome StageRunner::run(const store::Unit& unit, Stage stage) const {
    try {
        return run_unchecked(unit, stage);
    } catch (const StageError& e) {
        return make_outcome(OutcomeKind::FAILURE, e.what());
    } catch (const IOError& e) {
        return make_outcome(OutcomeKind::FAILURE, e.what());
    } catch (const fs::filesystem_error& e) {
        return make_outcome(OutcomeKind::FAILURE, std::string("filesystem: ") + e.what());
    }
}

StageOutcome StageRunner::run_unchecked(const store::Unit& unit, Stage stage) const {
    const config::StageConfig& sc = cfg_.stages.get(stage);

    fs::path input;
    if (sc.input == "raw") {
        if (!unit.raw_present || unit.raw_path.empty() || !fs::is_regular_file(unit.raw_path)) {
            // a forced rerun cannot rebuild from a deleted raw; the published output stands
            if (store_.is_complete(unit, stage)) {
                return make_outcome(OutcomeKind::SKIPPED, "raw deleted; derived output kept");
            }
            return make_outcome(OutcomeKind::FAILURE, "raw artifact missing");
        }
        input = unit.raw_path;
    } else {
        auto upstream = string_to_stage(sc.input);
        if (!upstream) {
            throw StageError("unknown input '" + sc.input + "'");
        }
        if (!store_.is_complete(unit, *upstream)) {
            return make_outcome(OutcomeKind::FAILURE,
                                "prerequisite stage '" + sc.input + "' is not complete");
        }
        input = store_.stage_output_dir(unit, *upstream);
    }

    store_.clear_staging(unit, stage);
    const fs::path staging = store_.staging_dir(unit, stage, run_id_);
    fs::create_directories(staging);

    const auto argv = expand_command(sc.command, input.string(), staging.string(),
                                     unit.id, unit.dir.string());

    const double timeout_s = cfg_.stage_timeout_seconds(stage);
    const int timeout_ms = static_cast<int>(
        std::ceil(std::min(timeout_s, config::kMaxStageTimeoutSeconds) * 1000.0));
    ProcessResult pr = process_.run(argv, timeout_ms, unit.dir.string());
    append_log(unit, stage, argv, pr);

    if (!pr.started) {
        return make_outcome(OutcomeKind::FAILURE, pr.error_message, -1, pr.duration_ms);
    }
    if (pr.timed_out) {
        return make_outcome(OutcomeKind::TIMEOUT, "timed out after " + format_seconds(timeout_s),
                            -1, pr.duration_ms);
    }
    if (pr.crashed) {
        return make_outcome(OutcomeKind::FAILURE, "process crashed", pr.exit_code, pr.duration_ms);
    }
    if (pr.exit_code != 0) {
        std::string reason = "exit code " + std::to_string(pr.exit_code);
        const std::string tail = core::trim(tail_text(pr.output, kReasonTailChars));
        if (!tail.empty()) {
            reason += ": " + tail;
        }
        return make_outcome(OutcomeKind::FAILURE, reason, pr.exit_code, pr.duration_ms);
    }

    if (!store::is_marker_complete(staging / sc.marker)) {
        return make_outcome(OutcomeKind::FAILURE,
                            "exit 0 but marker '" + sc.marker + "' missing or empty",
                            pr.exit_code, pr.duration_ms);
    }

    store_.publish(unit, stage, staging, run_id_);

    if (!store_.is_complete(unit, stage)) {
        return make_outcome(OutcomeKind::FAILURE, "marker not found after publish",
                            pr.exit_code, pr.duration_ms);
    }
    return make_outcome(OutcomeKind::SUCCESS, "", pr.exit_code, pr.duration_ms);
}

void StageRunner::append_log(const store::Unit& unit, Stage stage,
                             const std::vector<std::string>& argv,
                             const ProcessResult& result) const {
    const fs::path dir = store_.log_dir(unit);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("cannot create log directory " + dir.string() + ": " + ec.message());
    }

    std::ofstream out(dir / (stage_to_string(stage) + ".log"), std::ios::app);
    if (!out) {
        throw IOError("cannot open stage log in " + dir.string());
    }
    out << "=== " << core::get_iso_timestamp() << " run " << run_id_ << "\n";
    out << "$ " << core::join(argv, " ") << "\n";
    out << result.output;
    if (!result.output.empty() && result.output.back() != '\n') out << "\n";
    if (!result.started) {
        out << "[not started] " << result.error_message << "\n";
    } else if (result.timed_out) {
        out << "[killed after timeout]\n";
    } else {
        out << "[exit " << result.exit_code << "]\n";
    }
}

} // namespace arm_angle::runner
