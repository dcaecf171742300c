#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace arm_angle::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static void read_stage(const YAML::Node& s, StageConfig& out) {
    if (!s) return;
    if (s["enabled"]) out.enabled = s["enabled"].as<bool>();
    read_string_list(s["command"], out.command);
    if (s["input"]) out.input = s["input"].as<std::string>();
    if (s["output_dir"]) out.output_dir = s["output_dir"].as<std::string>();
    if (s["marker"]) out.marker = s["marker"].as<std::string>();
    if (s["timeout_seconds"]) out.timeout_seconds = s["timeout_seconds"].as<double>();
    if (s["delete_raw_on_success"]) out.delete_raw_on_success = s["delete_raw_on_success"].as<bool>();
}

static YAML::Node stage_to_yaml(const StageConfig& s) {
    YAML::Node node;
    node["enabled"] = s.enabled;
    node["command"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& arg : s.command) node["command"].push_back(arg);
    node["input"] = s.input;
    node["output_dir"] = s.output_dir;
    node["marker"] = s.marker;
    node["timeout_seconds"] = s.timeout_seconds;
    node["delete_raw_on_success"] = s.delete_raw_on_success;
    return node;
}

// Relative, non-empty and never escaping the unit directory
static bool is_safe_relative(const std::string& p) {
    if (p.empty()) return false;
    fs::path path(p);
    if (path.is_absolute()) return false;
    for (const auto& part : path) {
        if (part == "..") return false;
    }
    return true;
}

// One path equals the other or lies inside it, compared component-wise
static bool is_nested_or_same(const std::string& a, const std::string& b) {
    const fs::path pa = fs::path(a).lexically_normal();
    const fs::path pb = fs::path(b).lexically_normal();
    auto ia = pa.begin();
    auto ib = pb.begin();
    for (; ia != pa.end() && ib != pb.end(); ++ia, ++ib) {
        if (ia->empty() || ib->empty()) break; // trailing separator
        if (*ia != *ib) return false;
    }
    return true;
}

const StageConfig& StagesConfig::get(Stage stage) const {
    switch (stage) {
        case Stage::EXTRACT: return extract;
        case Stage::LABEL: return label;
        case Stage::MEASURE: return measure;
        default:
            throw PipelineError("stage '" + stage_to_string(stage) + "' has no unit configuration");
    }
}

StageConfig& StagesConfig::get(Stage stage) {
    return const_cast<StageConfig&>(static_cast<const StagesConfig&>(*this).get(stage));
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["paths"]) {
            auto p = node["paths"];
            if (p["videos_dir"]) cfg.paths.videos_dir = p["videos_dir"].as<std::string>();
            if (p["analysis_dir"]) cfg.paths.analysis_dir = p["analysis_dir"].as<std::string>();
            if (p["ground_truth"]) cfg.paths.ground_truth = p["ground_truth"].as<std::string>();
            if (p["raw_patterns"]) cfg.paths.raw_patterns = p["raw_patterns"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["stage_timeout_seconds"]) {
                cfg.runtime.stage_timeout_seconds = r["stage_timeout_seconds"].as<double>();
            }
        }

        if (node["stages"]) {
            auto s = node["stages"];
            read_stage(s["extract"], cfg.stages.extract);
            read_stage(s["label"], cfg.stages.label);
            read_stage(s["measure"], cfg.stages.measure);
            if (s["export"] && s["export"]["enabled"]) {
                cfg.stages.export_enabled = s["export"]["enabled"].as<bool>();
            }
        }

        if (node["ground_truth"]) {
            auto g = node["ground_truth"];
            if (g["id_column"]) cfg.ground_truth.id_column = g["id_column"].as<std::string>();
            if (g["angle_column"]) cfg.ground_truth.angle_column = g["angle_column"].as<std::string>();
        }

        if (node["aggregation"]) {
            auto a = node["aggregation"];
            if (a["tight_threshold_deg"]) cfg.aggregation.tight_threshold_deg = a["tight_threshold_deg"].as<double>();
            if (a["loose_threshold_deg"]) cfg.aggregation.loose_threshold_deg = a["loose_threshold_deg"].as<double>();
            if (a["variants"] && a["variants"].IsSequence()) {
                cfg.aggregation.variants.clear();
                for (const auto& v : a["variants"]) {
                    VariantConfig vc;
                    if (v["id"]) vc.id = v["id"].as<std::string>();
                    if (v["start_joint"]) vc.start_joint = v["start_joint"].as<std::string>();
                    if (v["column"]) vc.column = v["column"].as<std::string>();
                    if (vc.column.empty() && !vc.id.empty()) vc.column = "pitcher_angle_" + vc.id;
                    cfg.aggregation.variants.push_back(vc);
                }
            }
        }

        if (node["plot"]) {
            auto p = node["plot"];
            if (p["enabled"]) cfg.plot.enabled = p["enabled"].as<bool>();
            if (p["format"]) cfg.plot.format = p["format"].as<std::string>();
            if (p["bins"]) cfg.plot.bins = p["bins"].as<int>();
            if (p["bin_width"]) cfg.plot.bin_width = p["bin_width"].as<double>();
            read_string_list(p["pdf_converter"], cfg.plot.pdf_converter);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["videos_dir"] = paths.videos_dir;
    node["paths"]["analysis_dir"] = paths.analysis_dir;
    node["paths"]["ground_truth"] = paths.ground_truth;
    node["paths"]["raw_patterns"] = paths.raw_patterns;

    node["runtime"]["stage_timeout_seconds"] = runtime.stage_timeout_seconds;

    node["stages"]["extract"] = stage_to_yaml(stages.extract);
    node["stages"]["label"] = stage_to_yaml(stages.label);
    node["stages"]["measure"] = stage_to_yaml(stages.measure);
    node["stages"]["export"]["enabled"] = stages.export_enabled;

    node["ground_truth"]["id_column"] = ground_truth.id_column;
    node["ground_truth"]["angle_column"] = ground_truth.angle_column;

    node["aggregation"]["tight_threshold_deg"] = aggregation.tight_threshold_deg;
    node["aggregation"]["loose_threshold_deg"] = aggregation.loose_threshold_deg;
    node["aggregation"]["variants"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& v : aggregation.variants) {
        YAML::Node vn;
        vn["id"] = v.id;
        vn["start_joint"] = v.start_joint;
        vn["column"] = v.column;
        node["aggregation"]["variants"].push_back(vn);
    }

    node["plot"]["enabled"] = plot.enabled;
    node["plot"]["format"] = plot.format;
    node["plot"]["bins"] = plot.bins;
    node["plot"]["bin_width"] = plot.bin_width;
    node["plot"]["pdf_converter"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& arg : plot.pdf_converter) node["plot"]["pdf_converter"].push_back(arg);

    return node;
}

void Config::validate() const {
    if (paths.raw_patterns.empty()) {
        throw ValidationError("paths.raw_patterns must not be empty");
    }
    if (!(runtime.stage_timeout_seconds > 0.0) ||
        runtime.stage_timeout_seconds > kMaxStageTimeoutSeconds) {
        throw ValidationError("runtime.stage_timeout_seconds must be > 0 and <= " +
                              std::to_string(static_cast<int>(kMaxStageTimeoutSeconds)));
    }

    std::set<std::string> output_dirs;
    for (Stage stage : kUnitStages) {
        const StageConfig& s = stages.get(stage);
        const std::string name = "stages." + stage_to_string(stage);

        if (!is_safe_relative(s.output_dir)) {
            throw ValidationError(name + ".output_dir must be a relative path inside the unit directory");
        }
        if (!is_safe_relative(s.marker)) {
            throw ValidationError(name + ".marker must be a relative path inside output_dir");
        }
        const std::string top = fs::path(s.output_dir).lexically_normal().begin()->string();
        if (top == "." || top == ".staging" || top == ".logs" || top == "raw_artifact.json") {
            throw ValidationError(name + ".output_dir '" + s.output_dir + "' is reserved");
        }
        for (const auto& other : output_dirs) {
            if (is_nested_or_same(s.output_dir, other)) {
                throw ValidationError(name + ".output_dir '" + s.output_dir +
                                      "' overlaps the output_dir of another stage");
            }
        }
        output_dirs.insert(s.output_dir);
        if (!(s.timeout_seconds >= 0.0) || s.timeout_seconds > kMaxStageTimeoutSeconds) {
            throw ValidationError(name + ".timeout_seconds must be >= 0 and <= " +
                                  std::to_string(static_cast<int>(kMaxStageTimeoutSeconds)));
        }
        if (s.enabled && s.command.empty()) {
            throw ValidationError(name + ".command must be set when the stage is enabled");
        }
        if (s.input != "raw") {
            auto upstream = string_to_stage(s.input);
            if (!upstream || stage_to_int(*upstream) >= stage_to_int(stage)) {
                throw ValidationError(name + ".input must be 'raw' or an earlier stage");
            }
        }
    }

    if (aggregation.tight_threshold_deg <= 0.0) {
        throw ValidationError("aggregation.tight_threshold_deg must be > 0");
    }
    if (aggregation.loose_threshold_deg < aggregation.tight_threshold_deg) {
        throw ValidationError("aggregation.loose_threshold_deg must be >= tight_threshold_deg");
    }
    if (aggregation.variants.empty()) {
        throw ValidationError("aggregation.variants must not be empty");
    }
    std::set<std::string> ids;
    std::set<std::string> columns;
    std::set<std::string> joints;
    for (const auto& v : aggregation.variants) {
        if (v.id.empty() || v.start_joint.empty()) {
            throw ValidationError("aggregation.variants entries need id and start_joint");
        }
        if (!ids.insert(v.id).second || !columns.insert(v.column).second ||
            !joints.insert(v.start_joint).second) {
            throw ValidationError("aggregation.variants ids, columns and start_joints must be unique");
        }
        if (v.column == "video_id" || v.column == "frame_name" || v.column == "ground_truth_angle") {
            throw ValidationError("aggregation.variants column '" + v.column + "' is reserved");
        }
    }

    if (!string_to_plot_format(plot.format)) {
        throw ValidationError("plot.format must be one of png, svg, pdf, jpg");
    }
    if (plot.bins < 1 || plot.bins > kMaxHistogramBins) {
        throw ValidationError("plot.bins must be between 1 and " +
                              std::to_string(kMaxHistogramBins));
    }
    if (!(plot.bin_width >= 0.0) || !std::isfinite(plot.bin_width)) {
        throw ValidationError("plot.bin_width must be a finite value >= 0");
    }
}

fs::path Config::videos_dir() const {
    if (!paths.videos_dir.empty()) {
        return fs::path(paths.videos_dir);
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        throw ConfigError("paths.videos_dir is not set and HOME is undefined");
    }
    return fs::path(home) / "Desktop" / "baseball_vids";
}

fs::path Config::analysis_dir() const {
    if (!paths.analysis_dir.empty()) {
        return fs::path(paths.analysis_dir);
    }
    return videos_dir() / "data_analysis";
}

fs::path Config::ground_truth_path() const {
    if (!paths.ground_truth.empty()) {
        return fs::path(paths.ground_truth);
    }
    return videos_dir() / "ground_truth.csv";
}

double Config::stage_timeout_seconds(Stage stage) const {
    const StageConfig& s = stages.get(stage);
    return s.timeout_seconds > 0.0 ? s.timeout_seconds : runtime.stage_timeout_seconds;
}

} // namespace arm_angle::config
