#include "arm_angle/analysis/aggregation.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <map>

using arm_angle::analysis::AggregationResult;
using arm_angle::analysis::GroundTruthTable;
using arm_angle::analysis::Observation;
using arm_angle::analysis::ResultRow;
using arm_angle::analysis::SummaryMetrics;
using arm_angle::analysis::Thresholds;
using arm_angle::analysis::UnitObservations;
using arm_angle::analysis::aggregate;
using arm_angle::analysis::aggregate_per_observation;
using arm_angle::analysis::aggregate_per_unit_average;
using arm_angle::config::AggregationConfig;

namespace {

UnitObservations unit_with_shoulder(const std::string &id, const std::vector<double> &angles) {
  UnitObservations u;
  u.unit_id = id;
  for (size_t i = 0; i < angles.size(); ++i) {
    Observation o;
    o.frame_name = "frame_000" + std::to_string(i + 1);
    o.frame_index = static_cast<int>(i + 1);
    o.angles["shoulder_wrist"] = angles[i];
    o.angles["elbow_wrist"] = std::nullopt;
    u.frames.push_back(o);
  }
  return u;
}

// 4 units x 3 frames; per-unit means differ from per-frame spread
AggregationResult four_unit_fixture() {
  std::vector<UnitObservations> units{
      unit_with_shoulder("u1", {82.0, 78.0, 83.0}),
      unit_with_shoulder("u2", {90.0, 95.0, 100.0}),
      unit_with_shoulder("u3", {70.0, 70.0, 70.0}),
      unit_with_shoulder("u4", {50.0, 55.0, 75.0}),
  };
  GroundTruthTable gt;
  gt.angles = {{"u1", 80.0}, {"u2", 90.0}, {"u3", 70.0}, {"u4", 60.0}};
  return aggregate(units, gt, AggregationConfig{});
}

std::vector<ResultRow> rows_with_errors(const std::vector<double> &errors) {
  std::vector<ResultRow> rows;
  for (size_t i = 0; i < errors.size(); ++i) {
    ResultRow r;
    r.unit_id = "u" + std::to_string(i);
    r.frame_name = "frame_0001";
    r.variant_id = "shoulder_wrist";
    r.ground_truth = 50.0;
    r.prediction = 50.0 + errors[i];
    rows.push_back(r);
  }
  return rows;
}

} // namespace

TEST_CASE("per_observation_and_per_unit_mae_differ") {
  const AggregationResult result = four_unit_fixture();
  REQUIRE(result.rows.size() == 12);
  REQUIRE(result.summaries.size() == 2);

  const SummaryMetrics &m = result.summaries[0];
  REQUIRE(m.variant_id == "shoulder_wrist");
  REQUIRE(m.has_data);
  REQUIRE(m.n_frames == 12);
  REQUIRE(m.n_units == 4);
  REQUIRE(m.failed_frames == 0);
  // |errors| = 2,2,3 0,5,10 0,0,0 10,5,15
  REQUIRE(*m.mae_per_observation == Catch::Approx(52.0 / 12.0));
  // unit means 81,95,70,60 against 80,90,70,60
  REQUIRE(*m.mae_per_unit_average == Catch::Approx(1.5));
  // population std over the four reference angles
  REQUIRE(*m.std_ground_truth == Catch::Approx(11.180339887));
}

TEST_CASE("ties_count_neither_above_nor_below") {
  const SummaryMetrics m = four_unit_fixture().summaries[0];
  // 5 above, 3 below, 4 exact
  REQUIRE(*m.pct_above == Catch::Approx(100.0 * 5.0 / 12.0));
  REQUIRE(*m.pct_below == Catch::Approx(25.0));
  REQUIRE(*m.pct_above + *m.pct_below < 100.0);
  REQUIRE(*m.pct_within_tight == Catch::Approx(100.0 * 7.0 / 12.0));
  REQUIRE(*m.pct_within_loose == Catch::Approx(75.0));
}

TEST_CASE("threshold_percentages_for_known_errors") {
  auto s = aggregate_per_observation(rows_with_errors({1.0, 2.0, 4.0, 9.0}), Thresholds{3.0, 8.0});
  REQUIRE(s.n == 4);
  REQUIRE(*s.pct_within_tight == Catch::Approx(50.0));
  REQUIRE(*s.pct_within_loose == Catch::Approx(75.0));
  REQUIRE(*s.pct_above == Catch::Approx(100.0));
  REQUIRE(*s.pct_below == Catch::Approx(0.0));
}

TEST_CASE("threshold_boundary_counts_as_within") {
  auto s = aggregate_per_observation(rows_with_errors({3.0, -8.0}), Thresholds{3.0, 8.0});
  REQUIRE(*s.pct_within_tight == Catch::Approx(50.0));
  REQUIRE(*s.pct_within_loose == Catch::Approx(100.0));
}

TEST_CASE("empty_variant_reports_sentinels") {
  const SummaryMetrics m = four_unit_fixture().summaries[1];
  REQUIRE(m.variant_id == "elbow_wrist");
  REQUIRE_FALSE(m.has_data);
  REQUIRE(m.n_frames == 0);
  REQUIRE(m.n_units == 0);
  REQUIRE(m.failed_frames == 12);
  REQUIRE_FALSE(m.mae_per_observation);
  REQUIRE_FALSE(m.mae_per_unit_average);
  REQUIRE_FALSE(m.std_ground_truth);
  REQUIRE_FALSE(m.pct_above);
  REQUIRE_FALSE(m.pct_within_loose);
}

TEST_CASE("single_sample_has_mean_but_no_stddev") {
  auto rows = rows_with_errors({-2.0});
  auto obs = aggregate_per_observation(rows, Thresholds{});
  REQUIRE(*obs.mae == Catch::Approx(2.0));
  REQUIRE_FALSE(obs.std_prediction);
  REQUIRE_FALSE(obs.std_abs_error);

  auto unit = aggregate_per_unit_average(rows);
  REQUIRE(unit.n == 1);
  REQUIRE(*unit.mae == Catch::Approx(2.0));
  REQUIRE_FALSE(unit.std_ground_truth);
}

TEST_CASE("per_unit_average_uses_one_sample_per_unit") {
  std::vector<ResultRow> rows;
  for (double p : {10.0, 20.0, 30.0}) {
    ResultRow r;
    r.unit_id = "a";
    r.variant_id = "shoulder_wrist";
    r.prediction = p;
    r.ground_truth = 20.0;
    rows.push_back(r);
  }
  auto unit = aggregate_per_unit_average(rows);
  REQUIRE(unit.n == 1);
  REQUIRE(*unit.mae == Catch::Approx(0.0));

  auto obs = aggregate_per_observation(rows, Thresholds{});
  REQUIRE(*obs.mae == Catch::Approx(20.0 / 3.0));
}

TEST_CASE("units_without_ground_truth_are_excluded_and_listed") {
  std::vector<UnitObservations> units{unit_with_shoulder("known", {40.0}),
                                      unit_with_shoulder("unknown", {41.0, 42.0})};
  GroundTruthTable gt;
  gt.angles = {{"known", 45.0}};

  auto result = aggregate(units, gt, AggregationConfig{});
  REQUIRE(result.rows.size() == 1);
  REQUIRE(result.export_rows.size() == 1);
  REQUIRE(result.units_with_ground_truth == 1);
  REQUIRE(result.units_without_ground_truth == std::vector<std::string>{"unknown"});
  REQUIRE(result.summaries[0].n_units == 1);
}

TEST_CASE("export_rows_keep_absent_variants_and_sort_by_unit_and_frame") {
  UnitObservations b = unit_with_shoulder("b", {11.0, 12.0});
  b.frames[0].angles["shoulder_wrist"] = std::nullopt;
  b.frames[1].angles["elbow_wrist"] = 13.5;
  std::vector<UnitObservations> units{b, unit_with_shoulder("a", {10.0})};
  GroundTruthTable gt;
  gt.angles = {{"a", 9.0}, {"b", 12.0}};

  auto result = aggregate(units, gt, AggregationConfig{});
  REQUIRE(result.export_rows.size() == 3);
  REQUIRE(result.export_rows[0].unit_id == "a");
  REQUIRE(result.export_rows[1].unit_id == "b");
  REQUIRE_FALSE(result.export_rows[1].predictions[0]);
  REQUIRE(*result.export_rows[2].predictions[1] == Catch::Approx(13.5));
  REQUIRE(result.summaries[0].failed_frames == 1);
  REQUIRE(result.summaries[1].n_frames == 1);
  REQUIRE(result.rows.size() == 3);
  REQUIRE(result.summaries[1].failed_frames == 2);
}
