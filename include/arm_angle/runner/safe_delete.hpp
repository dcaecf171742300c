#pragma once

#include "arm_angle/core/types.hpp"
#include "arm_angle/runner/stage_runner.hpp"
#include "arm_angle/store/unit_store.hpp"

#include <string>

namespace arm_angle::runner {

enum class DeleteKind {
    DELETED,
    KEPT,
    FAILED
};

std::string delete_kind_to_string(DeleteKind kind);

struct DeleteOutcome {
    DeleteKind kind = DeleteKind::KEPT;
    std::string reason;
};

// Deletes the raw artifact of `unit` once `stage` is verifiably complete.
// A provenance record is written before the file is removed; if that fails the
// raw artifact stays. On DELETED, unit.raw_present is cleared.
DeleteOutcome maybe_delete_raw(const store::UnitStore& store, store::Unit& unit, Stage stage,
                               const StageOutcome& outcome, bool keep_raw);

} // namespace arm_angle::runner
