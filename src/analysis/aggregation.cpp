#include "arm_angle/analysis/aggregation.hpp"
#include "arm_angle/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace arm_angle::analysis {

namespace {

std::optional<double> mean_or_none(const VectorXd& v) {
    if (v.size() < 1) return std::nullopt;
    return core::mean_of(v);
}

std::optional<double> stddev_or_none(const VectorXd& v) {
    if (v.size() < 2) return std::nullopt;
    return core::stddev_of(v);
}

double percent(int count, int n) {
    return 100.0 * static_cast<double>(count) / static_cast<double>(n);
}

} // namespace

SampleStats aggregate_per_observation(const std::vector<ResultRow>& rows,
                                      const Thresholds& thresholds) {
    SampleStats s;
    s.n = static_cast<int>(rows.size());
    if (s.n == 0) return s;

    VectorXd pred(s.n);
    VectorXd gt(s.n);
    VectorXd abs_err(s.n);
    int above = 0;
    int below = 0;
    int tight = 0;
    int loose = 0;
    for (int i = 0; i < s.n; ++i) {
        const ResultRow& r = rows[static_cast<size_t>(i)];
        const double err = r.error();
        pred(i) = r.prediction;
        gt(i) = r.ground_truth;
        abs_err(i) = std::abs(err);
        if (err > 0.0) ++above;
        if (err < 0.0) ++below;
        if (std::abs(err) <= thresholds.tight) ++tight;
        if (std::abs(err) <= thresholds.loose) ++loose;
    }

    s.mae = mean_or_none(abs_err);
    s.std_prediction = stddev_or_none(pred);
    s.std_ground_truth = stddev_or_none(gt);
    s.std_abs_error = stddev_or_none(abs_err);
    s.pct_above = percent(above, s.n);
    s.pct_below = percent(below, s.n);
    s.pct_within_tight = percent(tight, s.n);
    s.pct_within_loose = percent(loose, s.n);
    return s;
}

SampleStats aggregate_per_unit_average(const std::vector<ResultRow>& rows) {
    struct Acc {
        double sum = 0.0;
        int count = 0;
        double ground_truth = 0.0;
    };
    std::map<std::string, Acc> per_unit;
    for (const auto& r : rows) {
        Acc& a = per_unit[r.unit_id];
        a.sum += r.prediction;
        a.count += 1;
        a.ground_truth = r.ground_truth;
    }

    SampleStats s;
    s.n = static_cast<int>(per_unit.size());
    if (s.n == 0) return s;

    VectorXd pred(s.n);
    VectorXd gt(s.n);
    VectorXd abs_err(s.n);
    int i = 0;
    for (const auto& [unit_id, a] : per_unit) {
        pred(i) = a.sum / static_cast<double>(a.count);
        gt(i) = a.ground_truth;
        abs_err(i) = std::abs(pred(i) - gt(i));
        ++i;
    }

    s.mae = mean_or_none(abs_err);
    s.std_prediction = stddev_or_none(pred);
    s.std_ground_truth = stddev_or_none(gt);
    s.std_abs_error = stddev_or_none(abs_err);
    return s;
}

SummaryMetrics summarize_variant(const config::VariantConfig& variant,
                                 const std::vector<ResultRow>& variant_rows,
                                 int failed_frames, const Thresholds& thresholds) {
    SummaryMetrics m;
    m.variant_id = variant.id;
    m.column = variant.column;
    m.failed_frames = failed_frames;
    if (variant_rows.empty()) {
        return m;
    }

    const SampleStats obs = aggregate_per_observation(variant_rows, thresholds);
    const SampleStats unit = aggregate_per_unit_average(variant_rows);

    m.has_data = true;
    m.n_frames = obs.n;
    m.n_units = unit.n;
    m.mae_per_observation = obs.mae;
    m.mae_per_unit_average = unit.mae;
    // one reference value per unit, so its spread is taken over units
    m.std_ground_truth = unit.std_ground_truth;
    m.std_prediction_per_observation = obs.std_prediction;
    m.std_prediction_per_unit_average = unit.std_prediction;
    m.std_abs_error_per_observation = obs.std_abs_error;
    m.pct_above = obs.pct_above;
    m.pct_below = obs.pct_below;
    m.pct_within_tight = obs.pct_within_tight;
    m.pct_within_loose = obs.pct_within_loose;
    return m;
}

std::vector<ResultRow> AggregationResult::rows_for(const std::string& variant_id) const {
    std::vector<ResultRow> out;
    for (const auto& r : rows) {
        if (r.variant_id == variant_id) out.push_back(r);
    }
    return out;
}

std::vector<ResultRow> build_result_rows(const std::vector<UnitObservations>& units,
                                         const GroundTruthTable& ground_truth,
                                         const std::vector<config::VariantConfig>& variants) {
    std::vector<ResultRow> rows;
    for (const auto& u : units) {
        const auto gt = ground_truth.find(u.unit_id);
        if (!gt) continue;
        for (const auto& obs : u.frames) {
            for (const auto& v : variants) {
                const auto angle = obs.angle(v.id);
                if (!angle) continue;
                ResultRow r;
                r.unit_id = u.unit_id;
                r.frame_name = obs.frame_name;
                r.variant_id = v.id;
                r.prediction = *angle;
                r.ground_truth = *gt;
                rows.push_back(std::move(r));
            }
        }
    }
    std::stable_sort(rows.begin(), rows.end(), [](const ResultRow& a, const ResultRow& b) {
        if (a.unit_id != b.unit_id) return a.unit_id < b.unit_id;
        return a.frame_name < b.frame_name;
    });
    return rows;
}

AggregationResult aggregate(const std::vector<UnitObservations>& units,
                            const GroundTruthTable& ground_truth,
                            const config::AggregationConfig& cfg) {
    AggregationResult result;
    result.rows = build_result_rows(units, ground_truth, cfg.variants);

    std::vector<int> failed(cfg.variants.size(), 0);
    for (const auto& u : units) {
        const auto gt = ground_truth.find(u.unit_id);
        if (!gt) {
            result.units_without_ground_truth.push_back(u.unit_id);
            continue;
        }
        ++result.units_with_ground_truth;
        for (const auto& obs : u.frames) {
            ExportRow er;
            er.unit_id = u.unit_id;
            er.frame_name = obs.frame_name;
            er.ground_truth = *gt;
            for (size_t vi = 0; vi < cfg.variants.size(); ++vi) {
                const auto angle = obs.angle(cfg.variants[vi].id);
                if (!angle) ++failed[vi];
                er.predictions.push_back(angle);
            }
            result.export_rows.push_back(std::move(er));
        }
    }
    std::sort(result.export_rows.begin(), result.export_rows.end(),
              [](const ExportRow& a, const ExportRow& b) {
                  if (a.unit_id != b.unit_id) return a.unit_id < b.unit_id;
                  return a.frame_name < b.frame_name;
              });

    const Thresholds thresholds{cfg.tight_threshold_deg, cfg.loose_threshold_deg};
    for (size_t vi = 0; vi < cfg.variants.size(); ++vi) {
        const auto& v = cfg.variants[vi];
        result.summaries.push_back(
            summarize_variant(v, result.rows_for(v.id), failed[vi], thresholds));
    }
    return result;
}

} // namespace arm_angle::analysis
