#include "arm_angle/analysis/export.hpp"
#include "arm_angle/core/utils.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace arm_angle::analysis {

using json = nlohmann::json;

namespace {

// Quotes a CSV field when it carries a separator, quote or line break.
std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    return "\"" + core::replace_all(s, "\"", "\"\"") + "\"";
}

json optional_to_json(const std::optional<double>& v) {
    if (!v) return nullptr;
    return std::round(*v * 1000.0) / 1000.0;
}

} // namespace

std::string format_value(const std::optional<double>& value, int decimals) {
    if (!value) return kNotAvailable;
    std::ostringstream oss;
    double v = *value;
    // keep "-0.000" out of the output
    const double scale = std::pow(10.0, decimals);
    if (std::round(v * scale) == 0.0) v = 0.0;
    oss << std::fixed << std::setprecision(decimals) << v;
    return oss.str();
}

std::string results_csv(const AggregationResult& result,
                        const std::vector<config::VariantConfig>& variants) {
    std::ostringstream out;
    out << "video_id,frame_name";
    for (const auto& v : variants) out << "," << csv_field(v.column);
    out << ",ground_truth_angle\n";

    for (const auto& row : result.export_rows) {
        out << csv_field(row.unit_id) << "," << csv_field(row.frame_name);
        for (const auto& p : row.predictions) out << "," << format_value(p);
        out << "," << format_value(row.ground_truth) << "\n";
    }
    return out.str();
}

std::string summary_csv(const AggregationResult& result) {
    std::ostringstream out;
    out << "variant,column,has_data,n_frames,n_units,failed_frames,"
           "mae_per_observation,mae_per_unit_average,std_ground_truth,"
           "std_prediction_per_observation,std_prediction_per_unit_average,"
           "std_abs_error_per_observation,pct_above,pct_below,"
           "pct_within_tight,pct_within_loose\n";

    for (const auto& m : result.summaries) {
        out << csv_field(m.variant_id) << "," << csv_field(m.column) << ","
            << (m.has_data ? "true" : "false") << "," << m.n_frames << "," << m.n_units << ","
            << m.failed_frames << "," << format_value(m.mae_per_observation) << ","
            << format_value(m.mae_per_unit_average) << "," << format_value(m.std_ground_truth)
            << "," << format_value(m.std_prediction_per_observation) << ","
            << format_value(m.std_prediction_per_unit_average) << ","
            << format_value(m.std_abs_error_per_observation) << "," << format_value(m.pct_above)
            << "," << format_value(m.pct_below) << "," << format_value(m.pct_within_tight) << ","
            << format_value(m.pct_within_loose) << "\n";
    }
    return out.str();
}

json summary_json(const AggregationResult& result, const config::AggregationConfig& cfg) {
    json j;
    j["generated_at"] = core::get_iso_timestamp();
    j["thresholds_deg"] = {{"tight", cfg.tight_threshold_deg},
                           {"loose", cfg.loose_threshold_deg}};
    j["units_with_ground_truth"] = result.units_with_ground_truth;
    j["units_without_ground_truth"] = result.units_without_ground_truth;

    json variants = json::array();
    for (const auto& m : result.summaries) {
        variants.push_back({
            {"variant", m.variant_id},
            {"column", m.column},
            {"has_data", m.has_data},
            {"n_frames", m.n_frames},
            {"n_units", m.n_units},
            {"failed_frames", m.failed_frames},
            {"mae_per_observation", optional_to_json(m.mae_per_observation)},
            {"mae_per_unit_average", optional_to_json(m.mae_per_unit_average)},
            {"std_ground_truth", optional_to_json(m.std_ground_truth)},
            {"std_prediction_per_observation", optional_to_json(m.std_prediction_per_observation)},
            {"std_prediction_per_unit_average", optional_to_json(m.std_prediction_per_unit_average)},
            {"std_abs_error_per_observation", optional_to_json(m.std_abs_error_per_observation)},
            {"pct_above", optional_to_json(m.pct_above)},
            {"pct_below", optional_to_json(m.pct_below)},
            {"pct_within_tight", optional_to_json(m.pct_within_tight)},
            {"pct_within_loose", optional_to_json(m.pct_within_loose)},
        });
    }
    j["variants"] = variants;
    return j;
}

ExportPaths export_paths_for(const fs::path& results_csv_path) {
    ExportPaths p;
    p.results_csv = results_csv_path;
    const fs::path dir = results_csv_path.parent_path();
    p.summary_csv = dir / "summary.csv";
    p.summary_json = dir / "summary.json";
    return p;
}

ExportPaths write_exports(const AggregationResult& result, const config::AggregationConfig& cfg,
                          const fs::path& results_csv_path) {
    const ExportPaths p = export_paths_for(results_csv_path);
    core::write_text_atomic(p.results_csv, results_csv(result, cfg.variants));
    core::write_text_atomic(p.summary_csv, summary_csv(result));
    core::write_text_atomic(p.summary_json, summary_json(result, cfg).dump(2) + "\n");
    return p;
}

} // namespace arm_angle::analysis
