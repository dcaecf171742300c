#include "arm_angle/analysis/observations.hpp"
#include "arm_angle/core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace arm_angle::analysis {

using json = nlohmann::json;

namespace {

constexpr const char* kFramePrefix = "frame_";
constexpr const char* kAngleSuffix = "_angle";

void merge_measurement(const json& m, const std::vector<config::VariantConfig>& variants,
                       Observation& obs) {
    if (!m.is_object()) return;
    const std::string joint = m.value("start_joint", std::string("shoulder"));
    auto it = std::find_if(variants.begin(), variants.end(),
                           [&joint](const config::VariantConfig& v) {
                               return v.start_joint == joint;
                           });
    if (it == variants.end()) return;

    std::optional<double> value;
    if (m.contains("arm_angle_degrees") && m["arm_angle_degrees"].is_number()) {
        value = m["arm_angle_degrees"].get<double>();
    }

    auto& slot = obs.angles[it->id];
    if (value) slot = value; // a later non-null value fills a missing one
}

} // namespace

std::optional<double> Observation::angle(const std::string& variant_id) const {
    auto it = angles.find(variant_id);
    if (it == angles.end()) return std::nullopt;
    return it->second;
}

std::string frame_name_from_dir(const std::string& dir_name) {
    if (core::ends_with(dir_name, kAngleSuffix)) {
        return dir_name.substr(0, dir_name.size() - std::string(kAngleSuffix).size());
    }
    return dir_name;
}

int frame_index_from_name(const std::string& frame_name) {
    if (!core::starts_with(frame_name, kFramePrefix)) return 0;
    const std::string digits = frame_name.substr(std::string(kFramePrefix).size());
    if (digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return 0;
    }
    return std::stoi(digits);
}

ObservationLoad load_observations(const fs::path& measure_dir,
                                  const std::vector<config::VariantConfig>& variants) {
    ObservationLoad load;
    if (!fs::is_directory(measure_dir)) return load;

    std::vector<fs::path> frame_dirs;
    for (const auto& entry : fs::directory_iterator(measure_dir)) {
        if (!entry.is_directory()) continue;
        const std::string name = entry.path().filename().string();
        if (core::glob_match("frame_*_angle", name)) {
            frame_dirs.push_back(entry.path());
        }
    }
    std::sort(frame_dirs.begin(), frame_dirs.end());

    for (const auto& dir : frame_dirs) {
        const fs::path data_path = dir / "data.json";
        if (!fs::exists(data_path)) continue;

        Observation obs;
        obs.frame_name = frame_name_from_dir(dir.filename().string());
        obs.frame_index = frame_index_from_name(obs.frame_name);
        for (const auto& v : variants) {
            obs.angles[v.id] = std::nullopt;
        }

        try {
            std::ifstream in(data_path);
            if (!in) {
                throw std::runtime_error("cannot open file");
            }
            json data = json::parse(in);

            if (data.contains("measurements") && data["measurements"].is_array()) {
                for (const auto& m : data["measurements"]) {
                    merge_measurement(m, variants, obs);
                }
            }
            if (data.contains("pitcher_data")) {
                merge_measurement(data["pitcher_data"], variants, obs);
            }
        } catch (const std::exception& e) {
            for (auto& [id, value] : obs.angles) value.reset();
            load.warnings.push_back("Failed to read " + data_path.string() + ": " + e.what());
        }

        load.frames.push_back(std::move(obs));
    }

    return load;
}

} // namespace arm_angle::analysis
