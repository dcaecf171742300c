#pragma once

#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/types.hpp"
#include "arm_angle/runner/process_runner.hpp"
#include "arm_angle/store/unit_store.hpp"

#include <string>
#include <vector>

namespace arm_angle::runner {

enum class OutcomeKind {
    SUCCESS,
    FAILURE,
    TIMEOUT,
    SKIPPED
};

std::string outcome_kind_to_string(OutcomeKind kind);

struct StageOutcome {
    OutcomeKind kind = OutcomeKind::FAILURE;
    std::string reason;
    int exit_code = -1;
    double duration_ms = 0.0;

    bool ok() const { return kind == OutcomeKind::SUCCESS; }
};

// Expands {input} {output} {unit_id} {unit_dir} in a stage command. When the
// template references neither input nor output, both are appended.
std::vector<std::string> expand_command(const std::vector<std::string>& command,
                                        const std::string& input,
                                        const std::string& output,
                                        const std::string& unit_id,
                                        const std::string& unit_dir);

class StageRunner {
public:
    StageRunner(const store::UnitStore& store, const config::Config& cfg, std::string run_id);

    // Runs one stage of one unit into a fresh staging directory and publishes
    // it when the command exits 0 and left a complete marker.
    StageOutcome run(const store::Unit& unit, Stage stage) const;

    const std::string& run_id() const { return run_id_; }

private:
    StageOutcome run_unchecked(const store::Unit& unit, Stage stage) const;
    void append_log(const store::Unit& unit, Stage stage,
                    const std::vector<std::string>& argv,
                    const ProcessResult& result) const;

    const store::UnitStore& store_;
    const config::Config& cfg_;
    std::string run_id_;
    ProcessRunner process_;
};

} // namespace arm_angle::runner
