#pragma once

#include "arm_angle/analysis/aggregation.hpp"
#include "arm_angle/config/configuration.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace arm_angle::analysis {

namespace fs = std::filesystem;

constexpr const char* kNotAvailable = "N/A";

// Fixed-point with `decimals` digits, or "N/A" for an empty value.
std::string format_value(const std::optional<double>& value, int decimals = 3);

std::string results_csv(const AggregationResult& result,
                        const std::vector<config::VariantConfig>& variants);
std::string summary_csv(const AggregationResult& result);
nlohmann::json summary_json(const AggregationResult& result, const config::AggregationConfig& cfg);

struct ExportPaths {
    fs::path results_csv;
    fs::path summary_csv;
    fs::path summary_json;
};

// summary.csv and summary.json live beside results.csv
ExportPaths export_paths_for(const fs::path& results_csv_path);

// Rewrites all three files atomically. Throws IOError.
ExportPaths write_exports(const AggregationResult& result, const config::AggregationConfig& cfg,
                          const fs::path& results_csv_path);

} // namespace arm_angle::analysis
