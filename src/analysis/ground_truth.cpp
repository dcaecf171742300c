#include "arm_angle/analysis/ground_truth.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace arm_angle::analysis {

std::optional<double> GroundTruthTable::find(const std::string& unit_id) const {
    auto it = angles.find(unit_id);
    if (it == angles.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    fields.push_back(cur);
    return fields;
}

GroundTruthTable parse_ground_truth(const std::string& csv_text,
                                    const config::GroundTruthConfig& cfg) {
    GroundTruthTable table;
    std::istringstream in(csv_text);
    std::string line;

    // header (a UTF-8 BOM is tolerated)
    if (!std::getline(in, line)) {
        throw ValidationError("ground truth file is empty");
    }
    if (core::starts_with(line, "\xEF\xBB\xBF")) line = line.substr(3);
    const auto header = parse_csv_line(line);

    int id_col = -1;
    int angle_col = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = core::trim(header[i]);
        if (name == cfg.id_column) id_col = static_cast<int>(i);
        if (name == cfg.angle_column) angle_col = static_cast<int>(i);
    }
    if (id_col < 0 || angle_col < 0) {
        throw ValidationError("ground truth header needs columns '" + cfg.id_column +
                              "' and '" + cfg.angle_column + "'");
    }

    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (core::trim(line).empty()) continue;
        const auto fields = parse_csv_line(line);
        const size_t need = static_cast<size_t>(std::max(id_col, angle_col));
        if (fields.size() <= need) {
            table.warnings.push_back("ground truth line " + std::to_string(line_no) +
                                     ": missing columns");
            continue;
        }

        const std::string id = core::trim(fields[static_cast<size_t>(id_col)]);
        const std::string raw = core::trim(fields[static_cast<size_t>(angle_col)]);
        if (id.empty()) continue;

        double angle = 0.0;
        try {
            size_t pos = 0;
            angle = std::stod(raw, &pos);
            if (pos != raw.size() || !std::isfinite(angle)) {
                throw std::invalid_argument(raw);
            }
        } catch (const std::exception&) {
            table.warnings.push_back("ground truth line " + std::to_string(line_no) +
                                     ": unparsable angle '" + raw + "' for " + id);
            continue;
        }

        if (table.angles.count(id)) {
            table.warnings.push_back("ground truth line " + std::to_string(line_no) +
                                     ": duplicate id " + id + ", later row wins");
        }
        table.angles[id] = angle;
    }

    return table;
}

GroundTruthTable load_ground_truth(const fs::path& csv_path,
                                   const config::GroundTruthConfig& cfg) {
    if (!fs::is_regular_file(csv_path)) {
        throw IOError("ground truth file not found: " + csv_path.string());
    }
    return parse_ground_truth(core::read_text(csv_path), cfg);
}

} // namespace arm_angle::analysis
