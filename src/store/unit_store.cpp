#include "arm_angle/store/unit_store.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"

#include <algorithm>
#include <map>
#include <system_error>
#include <utility>

namespace arm_angle::store {

namespace {

constexpr const char* kStagingDir = ".staging";
constexpr const char* kLogDir = ".logs";
constexpr const char* kProvenanceFile = "raw_artifact.json";

std::string flat_name(const std::string& output_dir) {
    return core::replace_all(fs::path(output_dir).generic_string(), "/", "_");
}

} // namespace

std::string describe_status(const UnitStatus& status) {
    std::string s = lifecycle_to_string(status.lifecycle);
    if (!status.raw_present && status.lifecycle != UnitLifecycle::RAW) {
        s += " (deleted-raw)";
    }
    return s;
}

std::string gate_decision_to_string(GateDecision decision) {
    switch (decision) {
        case GateDecision::SKIP: return "skip";
        case GateDecision::RUN: return "run";
        case GateDecision::FORCE_RUN: return "force_run";
        default: return "unknown";
    }
}

bool is_marker_complete(const fs::path& marker) {
    return core::has_non_whitespace_content(marker);
}

UnitStore::UnitStore(fs::path root, const config::Config& cfg)
    : root_(std::move(root)), cfg_(cfg) {
    std::error_code ec;
    const fs::path analysis = cfg_.analysis_dir();
    const fs::path a = fs::weakly_canonical(analysis, ec);
    const fs::path r = fs::weakly_canonical(root_, ec);
    if (!ec && a.parent_path() == r) {
        reserved_names_.push_back(a.filename().string());
    }
}

std::vector<Unit> UnitStore::discover() const {
    if (!fs::is_directory(root_)) {
        throw ConfigError("Videos directory not found: " + root_.string());
    }

    std::map<std::string, Unit> units;
    auto is_reserved = [this](const std::string& name) {
        return std::find(reserved_names_.begin(), reserved_names_.end(), name) !=
               reserved_names_.end();
    };

    for (const auto& raw : core::discover_files(root_, cfg_.paths.raw_patterns)) {
        const std::string id = raw.stem().string();
        if (id.empty() || core::starts_with(id, ".")) continue;
        if (is_reserved(id)) {
            throw ConfigError("Raw artifact " + raw.filename().string() +
                              " maps to reserved directory '" + id + "'");
        }
        auto it = units.find(id);
        if (it != units.end()) {
            throw ConfigError("Unit id collision: " + it->second.raw_path.filename().string() +
                              " and " + raw.filename().string() + " both map to '" + id + "'");
        }
        Unit u;
        u.id = id;
        u.dir = root_ / id;
        u.raw_path = raw;
        u.raw_present = true;
        units.emplace(id, std::move(u));
    }

    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_directory()) continue;
        const std::string name = entry.path().filename().string();
        if (name.empty() || core::starts_with(name, ".") || is_reserved(name)) continue;
        if (units.count(name)) continue;

        bool has_stage_output = false;
        for (Stage stage : kUnitStages) {
            if (fs::is_directory(entry.path() / cfg_.stages.get(stage).output_dir)) {
                has_stage_output = true;
                break;
            }
        }
        if (!has_stage_output) continue;

        Unit u;
        u.id = name;
        u.dir = entry.path();
        u.raw_present = false;
        units.emplace(name, std::move(u));
    }

    std::vector<Unit> out;
    out.reserve(units.size());
    for (auto& [id, unit] : units) {
        out.push_back(std::move(unit));
    }
    return out;
}

fs::path UnitStore::stage_output_dir(const Unit& unit, Stage stage) const {
    return unit.dir / cfg_.stages.get(stage).output_dir;
}

fs::path UnitStore::marker_path(const Unit& unit, Stage stage) const {
    return stage_output_dir(unit, stage) / cfg_.stages.get(stage).marker;
}

fs::path UnitStore::staging_root(const Unit& unit) const {
    return unit.dir / kStagingDir;
}

fs::path UnitStore::staging_dir(const Unit& unit, Stage stage, const std::string& run_id) const {
    return staging_root(unit) / (flat_name(cfg_.stages.get(stage).output_dir) + "." + run_id);
}

fs::path UnitStore::log_dir(const Unit& unit) const {
    return unit.dir / kLogDir;
}

fs::path UnitStore::provenance_path(const Unit& unit) const {
    return unit.dir / kProvenanceFile;
}

bool UnitStore::is_complete(const Unit& unit, Stage stage) const {
    return is_marker_complete(marker_path(unit, stage));
}

GateDecision UnitStore::decide(const Unit& unit, Stage stage, bool force) const {
    const bool complete = is_complete(unit, stage);
    if (force) {
        return complete ? GateDecision::FORCE_RUN : GateDecision::RUN;
    }
    return complete ? GateDecision::SKIP : GateDecision::RUN;
}

UnitStatus UnitStore::status(const Unit& unit) const {
    UnitStatus st;
    st.raw_present = unit.raw_present;
    st.extract_complete = is_complete(unit, Stage::EXTRACT);
    st.label_complete = is_complete(unit, Stage::LABEL);
    st.measure_complete = is_complete(unit, Stage::MEASURE);

    if (st.extract_complete) {
        st.lifecycle = UnitLifecycle::EXTRACTED;
        if (st.label_complete) {
            st.lifecycle = UnitLifecycle::LABELED;
            if (st.measure_complete) {
                st.lifecycle = UnitLifecycle::MEASURED;
            }
        }
    }
    return st;
}

void UnitStore::clear_staging(const Unit& unit, Stage stage) const {
    const fs::path root = staging_root(unit);
    if (!fs::is_directory(root)) return;

    const std::string prefix = flat_name(cfg_.stages.get(stage).output_dir) + ".";
    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (core::starts_with(entry.path().filename().string(), prefix)) {
            stale.push_back(entry.path());
        }
    }
    for (const auto& p : stale) {
        std::error_code ec;
        fs::remove_all(p, ec);
        if (ec) {
            throw StageError("cannot remove stale staging " + p.string() + ": " + ec.message());
        }
    }
}

void UnitStore::publish(const Unit& unit, Stage stage, const fs::path& staging,
                        const std::string& run_id) const {
    const fs::path final_dir = stage_output_dir(unit, stage);
    fs::create_directories(final_dir.parent_path());

    std::error_code ec;
    fs::path aside;
    if (fs::exists(final_dir)) {
        aside = staging_root(unit) /
                (flat_name(cfg_.stages.get(stage).output_dir) + ".replaced." + run_id);
        fs::remove_all(aside, ec);
        fs::rename(final_dir, aside, ec);
        if (ec) {
            throw StageError("cannot move previous output aside: " + ec.message());
        }
    }

    fs::rename(staging, final_dir, ec);
    if (ec) {
        const std::string msg = ec.message();
        if (!aside.empty()) {
            std::error_code restore_ec;
            fs::rename(aside, final_dir, restore_ec);
        }
        throw StageError("cannot publish " + final_dir.string() + ": " + msg);
    }

    if (!aside.empty()) {
        fs::remove_all(aside, ec);
    }
}

} // namespace arm_angle::store
