#include "arm_angle/runner/safe_delete.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <system_error>

namespace arm_angle::runner {

std::string delete_kind_to_string(DeleteKind kind) {
    switch (kind) {
        case DeleteKind::DELETED: return "deleted";
        case DeleteKind::KEPT: return "kept";
        case DeleteKind::FAILED: return "failed";
        default: return "unknown";
    }
}

DeleteOutcome maybe_delete_raw(const store::UnitStore& store, store::Unit& unit, Stage stage,
                               const StageOutcome& outcome, bool keep_raw) {
    DeleteOutcome result;

    if (outcome.kind != OutcomeKind::SUCCESS && outcome.kind != OutcomeKind::SKIPPED) {
        result.reason = "stage did not succeed";
        return result;
    }
    if (keep_raw) {
        result.reason = "keep_raw";
        return result;
    }
    if (!unit.raw_present || unit.raw_path.empty() || !fs::is_regular_file(unit.raw_path)) {
        result.reason = "raw artifact not present";
        return result;
    }

    // Re-read the marker right before the destructive step.
    if (!store.is_complete(unit, stage)) {
        result.kind = DeleteKind::FAILED;
        result.reason = "marker no longer verifies; raw artifact kept";
        return result;
    }

    const fs::path record = store.provenance_path(unit);
    try {
        std::error_code ec;
        const auto size = fs::file_size(unit.raw_path, ec);
        if (ec) {
            throw IOError("cannot stat " + unit.raw_path.string() + ": " + ec.message());
        }
        nlohmann::json j;
        j["unit_id"] = unit.id;
        j["name"] = unit.raw_path.filename().string();
        j["size_bytes"] = static_cast<uint64_t>(size);
        j["sha256"] = core::sha256_file(unit.raw_path);
        j["deleted_at"] = core::get_iso_timestamp();
        j["verified_stage"] = stage_to_string(stage);
        core::write_text_atomic(record, j.dump(2) + "\n");
    } catch (const IOError& e) {
        result.kind = DeleteKind::FAILED;
        result.reason = std::string("provenance record not written: ") + e.what();
        return result;
    }

    std::error_code ec;
    if (!fs::remove(unit.raw_path, ec) || ec) {
        result.kind = DeleteKind::FAILED;
        result.reason = "cannot remove " + unit.raw_path.string() +
                        (ec ? ": " + ec.message() : std::string());
        std::error_code cleanup_ec;
        fs::remove(record, cleanup_ec);
        return result;
    }

    unit.raw_present = false;
    result.kind = DeleteKind::DELETED;
    return result;
}

} // namespace arm_angle::runner
