#pragma once

#include "arm_angle/core/types.hpp"

#include <climits>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace arm_angle::config {

namespace fs = std::filesystem;

constexpr int kMaxHistogramBins = 10000;
// Timeouts are handed to QProcess in milliseconds as int
constexpr double kMaxStageTimeoutSeconds = INT_MAX / 1000;

struct PathsConfig {
  std::string videos_dir;   // empty = $HOME/Desktop/baseball_vids
  std::string analysis_dir; // empty = <videos_dir>/data_analysis
  std::string ground_truth; // empty = <videos_dir>/ground_truth.csv
  std::string raw_patterns = "*.mp4;*.mov;*.avi;*.mkv";
};

struct RuntimeConfig {
  double stage_timeout_seconds = 300.0;
};

struct StageConfig {
  bool enabled = true;
  // argv with {input} {output} {unit_id} {unit_dir} placeholders
  std::vector<std::string> command;
  std::string input = "raw"; // raw | extract | label
  std::string output_dir;    // relative to the unit directory
  std::string marker = "manifest.json"; // relative to output_dir
  double timeout_seconds = 0.0;         // 0 = runtime.stage_timeout_seconds
  bool delete_raw_on_success = false;
};

struct StagesConfig {
  StageConfig extract{true, {}, "raw", "release_frames", "manifest.json", 0.0, true};
  StageConfig label{true, {}, "extract", "pitcher_labels", "manifest.json", 0.0, false};
  StageConfig measure{true, {}, "label", "pitcher_calculations", "manifest.json", 0.0, false};
  bool export_enabled = true;

  const StageConfig &get(Stage stage) const;
  StageConfig &get(Stage stage);
};

struct GroundTruthConfig {
  std::string id_column = "PitchId";
  std::string angle_column = "ArmAngle";
};

struct VariantConfig {
  std::string id;
  std::string start_joint;
  std::string column;
};

struct AggregationConfig {
  double tight_threshold_deg = 3.0;
  double loose_threshold_deg = 8.0;
  std::vector<VariantConfig> variants{
      {"shoulder_wrist", "shoulder", "pitcher_angle_shoulder_wrist"},
      {"elbow_wrist", "elbow", "pitcher_angle_elbow_wrist"},
  };
};

struct PlotConfig {
  bool enabled = false;
  std::string format = "png"; // png | svg | pdf | jpg
  int bins = 20;
  double bin_width = 0.0;     // > 0 overrides bins
  std::vector<std::string> pdf_converter{"rsvg-convert", "-f", "pdf", "-o",
                                         "{output}", "{input}"};
};

struct Config {
  PathsConfig paths;
  RuntimeConfig runtime;
  StagesConfig stages;
  GroundTruthConfig ground_truth;
  AggregationConfig aggregation;
  PlotConfig plot;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  fs::path videos_dir() const;
  fs::path analysis_dir() const;
  fs::path ground_truth_path() const;
  double stage_timeout_seconds(Stage stage) const;
};

} // namespace arm_angle::config
