#include "arm_angle/core/events.hpp"
#include "arm_angle/core/utils.hpp"

#include <utility>

namespace arm_angle::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_start(Stage stage, int total_units) {
    json event = base_event("phase_start");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["total"] = total_units;
    emit(event);
}

void EventEmitter::phase_end(Stage stage, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::unit_processed(Stage stage, int unit_idx, int total_units,
                                  const std::string& unit_id, const std::string& status,
                                  const json& extra) {
    json event = base_event("unit_processed");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["current"] = unit_idx;
    event["total"] = total_units;
    event["unit_id"] = unit_id;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace arm_angle::core
