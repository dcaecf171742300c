#pragma once

#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace arm_angle::store {

namespace fs = std::filesystem;

// One raw video and its derived directory tree. Recomputed from disk on every
// invocation; nothing here survives between runs.
struct Unit {
    std::string id;
    fs::path dir;
    fs::path raw_path;  // empty when the unit was discovered from its directory only
    bool raw_present = false;
};

struct UnitStatus {
    UnitLifecycle lifecycle = UnitLifecycle::RAW;
    bool raw_present = false;
    bool extract_complete = false;
    bool label_complete = false;
    bool measure_complete = false;
};

// "measured", or "measured (deleted-raw)" when the raw artifact is gone
std::string describe_status(const UnitStatus& status);

enum class GateDecision {
    SKIP,
    RUN,
    FORCE_RUN
};

std::string gate_decision_to_string(GateDecision decision);

// Marker predicate: regular file, non-empty, at least one non-whitespace byte.
bool is_marker_complete(const fs::path& marker);

class UnitStore {
public:
    UnitStore(fs::path root, const config::Config& cfg);

    const fs::path& root() const { return root_; }

    // Sorted by id. Throws ConfigError when two raw artifacts map to one id.
    std::vector<Unit> discover() const;

    fs::path stage_output_dir(const Unit& unit, Stage stage) const;
    fs::path marker_path(const Unit& unit, Stage stage) const;
    fs::path staging_root(const Unit& unit) const;
    fs::path staging_dir(const Unit& unit, Stage stage, const std::string& run_id) const;
    fs::path log_dir(const Unit& unit) const;
    fs::path provenance_path(const Unit& unit) const;

    bool is_complete(const Unit& unit, Stage stage) const;
    GateDecision decide(const Unit& unit, Stage stage, bool force) const;
    UnitStatus status(const Unit& unit) const;

    // Removes leftovers of earlier failed attempts of this unit/stage.
    void clear_staging(const Unit& unit, Stage stage) const;

    // Moves a finished staging directory into place as the stage output.
    // An existing output is renamed aside first and removed last, so a crash in
    // between leaves the stage reading as incomplete.
    void publish(const Unit& unit, Stage stage, const fs::path& staging_dir,
                 const std::string& run_id) const;

private:
    fs::path root_;
    const config::Config& cfg_;
    std::vector<std::string> reserved_names_;
};

} // namespace arm_angle::store
