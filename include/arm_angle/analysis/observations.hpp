#pragma once

#include "arm_angle/config/configuration.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arm_angle::analysis {

namespace fs = std::filesystem;

// One frame of one unit. `angles` is keyed by variant id; a missing key or an
// empty optional is an absent measurement.
struct Observation {
    std::string frame_name;
    int frame_index = 0;
    std::map<std::string, std::optional<double>> angles;

    std::optional<double> angle(const std::string& variant_id) const;
};

struct UnitObservations {
    std::string unit_id;
    std::vector<Observation> frames; // sorted by frame_name
};

struct ObservationLoad {
    std::vector<Observation> frames;
    std::vector<std::string> warnings;
};

// Reads <measure_dir>/frame_NNNN_angle/data.json for every frame directory.
// Accepts {"measurements": [...]} and the single {"pitcher_data": {...}} layout.
// A data.json that cannot be parsed yields a frame with every variant absent.
ObservationLoad load_observations(const fs::path& measure_dir,
                                  const std::vector<config::VariantConfig>& variants);

// "frame_0007_angle" -> "frame_0007"
std::string frame_name_from_dir(const std::string& dir_name);

// "frame_0007" -> 7, 0 when the name carries no index
int frame_index_from_name(const std::string& frame_name);

} // namespace arm_angle::analysis
