#pragma once

#include "arm_angle/analysis/ground_truth.hpp"
#include "arm_angle/analysis/observations.hpp"
#include "arm_angle/config/configuration.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arm_angle::analysis {

// One present (unit, frame, variant) measurement joined with its reference.
struct ResultRow {
    std::string unit_id;
    std::string frame_name;
    std::string variant_id;
    double prediction = 0.0;
    double ground_truth = 0.0;

    double error() const { return prediction - ground_truth; }
};

// One line of results.csv: every variant of one frame, absent values empty.
struct ExportRow {
    std::string unit_id;
    std::string frame_name;
    std::vector<std::optional<double>> predictions; // in variant order
    double ground_truth = 0.0;
};

// Statistics over one sample set. Every optional stays empty when there are
// too few samples (mean needs 1, standard deviation needs 2).
struct SampleStats {
    int n = 0;
    std::optional<double> mae;
    std::optional<double> std_prediction;
    std::optional<double> std_ground_truth;
    std::optional<double> std_abs_error;
    std::optional<double> pct_above;
    std::optional<double> pct_below;
    std::optional<double> pct_within_tight;
    std::optional<double> pct_within_loose;
};

struct Thresholds {
    double tight = 3.0;
    double loose = 8.0;
};

// Every row is one sample. Percentages are 0..100; ties are neither above nor
// below; within a threshold means |error| <= threshold.
SampleStats aggregate_per_observation(const std::vector<ResultRow>& rows,
                                      const Thresholds& thresholds);

// One sample per unit: mean prediction of the unit against its reference.
// Threshold percentages are not computed at this level.
SampleStats aggregate_per_unit_average(const std::vector<ResultRow>& rows);

struct SummaryMetrics {
    std::string variant_id;
    std::string column;
    bool has_data = false;
    int n_frames = 0;
    int n_units = 0;
    int failed_frames = 0;

    std::optional<double> mae_per_observation;
    std::optional<double> mae_per_unit_average;
    std::optional<double> std_ground_truth;
    std::optional<double> std_prediction_per_observation;
    std::optional<double> std_prediction_per_unit_average;
    std::optional<double> std_abs_error_per_observation;
    std::optional<double> pct_above;
    std::optional<double> pct_below;
    std::optional<double> pct_within_tight;
    std::optional<double> pct_within_loose;
};

SummaryMetrics summarize_variant(const config::VariantConfig& variant,
                                 const std::vector<ResultRow>& variant_rows,
                                 int failed_frames, const Thresholds& thresholds);

struct AggregationResult {
    std::vector<ResultRow> rows;
    std::vector<ExportRow> export_rows;
    std::vector<SummaryMetrics> summaries; // in variant order
    std::vector<std::string> units_without_ground_truth;
    std::vector<std::string> warnings;
    int units_with_ground_truth = 0;

    std::vector<ResultRow> rows_for(const std::string& variant_id) const;
};

std::vector<ResultRow> build_result_rows(const std::vector<UnitObservations>& units,
                                         const GroundTruthTable& ground_truth,
                                         const std::vector<config::VariantConfig>& variants);

AggregationResult aggregate(const std::vector<UnitObservations>& units,
                            const GroundTruthTable& ground_truth,
                            const config::AggregationConfig& cfg);

} // namespace arm_angle::analysis
