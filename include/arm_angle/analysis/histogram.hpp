#pragma once

#include "arm_angle/analysis/aggregation.hpp"
#include "arm_angle/config/configuration.hpp"
#include "arm_angle/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace arm_angle::analysis {

namespace fs = std::filesystem;

struct Histogram {
    std::vector<double> edges; // counts.size() + 1 entries, ascending
    std::vector<int> counts;

    bool empty() const { return counts.empty(); }
    int total() const;
};

// bin_width > 0 takes precedence over bins; width edges sit on multiples of
// bin_width. The last bin is closed on the right.
Histogram compute_histogram(const std::vector<double>& values, int bins, double bin_width);

std::string render_histogram_svg(const Histogram& h, const std::string& title,
                                 const std::string& x_label);

// PNG/JPG via OpenCV. Throws IOError when the image cannot be written.
void write_histogram_raster(const Histogram& h, const std::string& title,
                            const fs::path& out_path);

// Writes one error histogram per variant with data into `plots_dir`.
// Throws IOError on write failures and StageError when the PDF converter fails.
std::vector<fs::path> write_error_histograms(const AggregationResult& result,
                                             const config::PlotConfig& plot,
                                             const fs::path& plots_dir);

} // namespace arm_angle::analysis
