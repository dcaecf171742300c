#pragma once

#include "arm_angle/config/configuration.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arm_angle::analysis {

namespace fs = std::filesystem;

struct GroundTruthTable {
    std::map<std::string, double> angles; // unit id -> reference angle (degrees)
    std::vector<std::string> warnings;

    std::optional<double> find(const std::string& unit_id) const;
};

// Splits one CSV record; double quotes group fields and "" is a literal quote.
std::vector<std::string> parse_csv_line(const std::string& line);

// Throws IOError when the file cannot be read and ValidationError when the
// header lacks the configured id or angle column. Rows with an unparsable
// angle are skipped with a warning.
GroundTruthTable load_ground_truth(const fs::path& csv_path,
                                   const config::GroundTruthConfig& cfg);

GroundTruthTable parse_ground_truth(const std::string& csv_text,
                                    const config::GroundTruthConfig& cfg);

} // namespace arm_angle::analysis
