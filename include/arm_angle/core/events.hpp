#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace arm_angle::core {

using json = nlohmann::json;

// JSON-lines event stream of a run; one object per line.
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());

    void phase_start(Stage stage, int total_units);
    void phase_end(Stage stage, const std::string& status, const json& extra);

    void unit_processed(Stage stage, int unit_idx, int total_units,
                        const std::string& unit_id, const std::string& status,
                        const json& extra = json::object());

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
};

} // namespace arm_angle::core
