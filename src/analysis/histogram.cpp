#include "arm_angle/analysis/histogram.hpp"
#include "arm_angle/core/errors.hpp"
#include "arm_angle/core/utils.hpp"
#include "arm_angle/runner/process_runner.hpp"
#include "arm_angle/runner/stage_runner.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace arm_angle::analysis {

namespace {

constexpr int kWidth = 800;
constexpr int kHeight = 500;
constexpr int kMarginLeft = 70;
constexpr int kMarginRight = 30;
constexpr int kMarginTop = 50;
constexpr int kMarginBottom = 60;
constexpr int kConverterTimeoutMs = 60000;

std::string fmt(double v, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << v;
    return oss.str();
}

std::string xml_escape(const std::string& s) {
    std::string out = core::replace_all(s, "&", "&amp;");
    out = core::replace_all(out, "<", "&lt;");
    out = core::replace_all(out, ">", "&gt;");
    return out;
}

} // namespace

int Histogram::total() const {
    int n = 0;
    for (int c : counts) n += c;
    return n;
}

Histogram compute_histogram(const std::vector<double>& values, int bins, double bin_width) {
    Histogram h;
    if (values.empty()) return h;

    const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    double lo = *min_it;
    double hi = *max_it;
    int n = 0;
    double width = 0.0;

    if (bin_width > 0.0) {
        lo = std::floor(lo / bin_width) * bin_width;
        // widen to a multiple of bin_width so edges stay aligned and the count bounded
        const double span = hi - lo;
        double factor = 1.0;
        double needed = std::ceil(span / bin_width);
        while (!(needed <= config::kMaxHistogramBins) && std::isfinite(factor)) {
            factor = std::max(factor + std::max(1.0, std::ceil(factor * 1e-6)),
                              std::ceil(span / (bin_width * config::kMaxHistogramBins)));
            needed = std::ceil(span / (bin_width * factor));
        }
        if (!std::isfinite(needed)) needed = config::kMaxHistogramBins;
        width = bin_width * factor;
        n = std::clamp(static_cast<int>(needed), 1, config::kMaxHistogramBins);
    } else {
        n = std::clamp(bins, 1, config::kMaxHistogramBins);
        if (hi <= lo) {
            lo -= 0.5;
            hi += 0.5;
        }
        width = (hi - lo) / n;
    }

    h.edges.resize(static_cast<size_t>(n) + 1);
    for (int i = 0; i <= n; ++i) {
        h.edges[static_cast<size_t>(i)] = lo + i * width;
    }
    h.counts.assign(static_cast<size_t>(n), 0);
    for (double v : values) {
        int idx = static_cast<int>(std::floor((v - lo) / width));
        idx = std::clamp(idx, 0, n - 1);
        h.counts[static_cast<size_t>(idx)]++;
    }
    return h;
}

std::string render_histogram_svg(const Histogram& h, const std::string& title,
                                 const std::string& x_label) {
    const int plot_w = kWidth - kMarginLeft - kMarginRight;
    const int plot_h = kHeight - kMarginTop - kMarginBottom;
    const int max_count = h.empty() ? 1 : std::max(1, *std::max_element(h.counts.begin(), h.counts.end()));

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << kWidth << "\" height=\""
        << kHeight << "\" viewBox=\"0 0 " << kWidth << " " << kHeight << "\">\n";
    svg << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    svg << "<text x=\"" << kWidth / 2 << "\" y=\"30\" text-anchor=\"middle\" "
        << "font-family=\"sans-serif\" font-size=\"18\">" << xml_escape(title) << "</text>\n";

    const int n = static_cast<int>(h.counts.size());
    for (int i = 0; i < n; ++i) {
        const double bar_h = static_cast<double>(plot_h) * h.counts[static_cast<size_t>(i)] / max_count;
        const double x = kMarginLeft + static_cast<double>(plot_w) * i / n;
        const double w = static_cast<double>(plot_w) / n;
        svg << "<rect x=\"" << fmt(x, 2) << "\" y=\"" << fmt(kMarginTop + plot_h - bar_h, 2)
            << "\" width=\"" << fmt(w, 2) << "\" height=\"" << fmt(bar_h, 2)
            << "\" fill=\"#4c72b0\" stroke=\"black\" stroke-width=\"0.5\"/>\n";
    }

    // axes
    svg << "<line x1=\"" << kMarginLeft << "\" y1=\"" << kMarginTop + plot_h << "\" x2=\""
        << kMarginLeft + plot_w << "\" y2=\"" << kMarginTop + plot_h << "\" stroke=\"black\"/>\n";
    svg << "<line x1=\"" << kMarginLeft << "\" y1=\"" << kMarginTop << "\" x2=\"" << kMarginLeft
        << "\" y2=\"" << kMarginTop + plot_h << "\" stroke=\"black\"/>\n";

    if (!h.empty()) {
        const double lo = h.edges.front();
        const double hi = h.edges.back();
        svg << "<text x=\"" << kMarginLeft << "\" y=\"" << kMarginTop + plot_h + 20
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">"
            << fmt(lo, 1) << "</text>\n";
        svg << "<text x=\"" << kMarginLeft + plot_w << "\" y=\"" << kMarginTop + plot_h + 20
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">"
            << fmt(hi, 1) << "</text>\n";
        svg << "<text x=\"" << kMarginLeft - 8 << "\" y=\"" << kMarginTop + 4
            << "\" text-anchor=\"end\" font-family=\"sans-serif\" font-size=\"12\">" << max_count
            << "</text>\n";
    }
    svg << "<text x=\"" << kMarginLeft + plot_w / 2 << "\" y=\"" << kHeight - 15
        << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"14\">"
        << xml_escape(x_label) << "</text>\n";
    svg << "</svg>\n";
    return svg.str();
}

void write_histogram_raster(const Histogram& h, const std::string& title,
                            const fs::path& out_path) {
    cv::Mat img(kHeight, kWidth, CV_8UC3, cv::Scalar(255, 255, 255));
    const int plot_w = kWidth - kMarginLeft - kMarginRight;
    const int plot_h = kHeight - kMarginTop - kMarginBottom;
    const int base_y = kMarginTop + plot_h;
    const int max_count = h.empty() ? 1 : std::max(1, *std::max_element(h.counts.begin(), h.counts.end()));

    const int n = static_cast<int>(h.counts.size());
    for (int i = 0; i < n; ++i) {
        const int x0 = kMarginLeft + plot_w * i / n;
        const int x1 = kMarginLeft + plot_w * (i + 1) / n;
        const int bar_h = plot_h * h.counts[static_cast<size_t>(i)] / max_count;
        if (bar_h <= 0) continue;
        cv::Rect bar(x0, base_y - bar_h, std::max(1, x1 - x0), bar_h);
        cv::rectangle(img, bar, cv::Scalar(176, 114, 76), cv::FILLED);
        cv::rectangle(img, bar, cv::Scalar(0, 0, 0), 1);
    }

    cv::line(img, {kMarginLeft, base_y}, {kMarginLeft + plot_w, base_y}, {0, 0, 0}, 1, cv::LINE_AA);
    cv::line(img, {kMarginLeft, kMarginTop}, {kMarginLeft, base_y}, {0, 0, 0}, 1, cv::LINE_AA);
    cv::putText(img, title, {kMarginLeft, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.6, {0, 0, 0}, 1,
                cv::LINE_AA);
    if (!h.empty()) {
        cv::putText(img, fmt(h.edges.front(), 1), {kMarginLeft - 15, base_y + 20},
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, {0, 0, 0}, 1, cv::LINE_AA);
        cv::putText(img, fmt(h.edges.back(), 1), {kMarginLeft + plot_w - 15, base_y + 20},
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, {0, 0, 0}, 1, cv::LINE_AA);
        cv::putText(img, std::to_string(max_count), {10, kMarginTop + 5},
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, {0, 0, 0}, 1, cv::LINE_AA);
    }
    cv::putText(img, "error (deg)", {kMarginLeft + plot_w / 2 - 40, kHeight - 15},
                cv::FONT_HERSHEY_SIMPLEX, 0.5, {0, 0, 0}, 1, cv::LINE_AA);

    fs::create_directories(out_path.parent_path());
    bool ok = false;
    try {
        ok = cv::imwrite(out_path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + out_path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + out_path.string());
    }
}

std::vector<fs::path> write_error_histograms(const AggregationResult& result,
                                             const config::PlotConfig& plot,
                                             const fs::path& plots_dir) {
    const auto format = string_to_plot_format(plot.format);
    if (!format) {
        throw ConfigError("unsupported plot format '" + plot.format + "'");
    }

    std::vector<fs::path> written;
    for (const auto& summary : result.summaries) {
        if (!summary.has_data) continue;

        std::vector<double> errors;
        for (const auto& r : result.rows_for(summary.variant_id)) {
            errors.push_back(r.error());
        }
        const Histogram h = compute_histogram(errors, plot.bins, plot.bin_width);
        const std::string title = "Prediction error: " + summary.variant_id + " (n=" +
                                  std::to_string(h.total()) + ")";
        const fs::path out = plots_dir / ("error_histogram_" + summary.variant_id + "." +
                                          plot_format_to_string(*format));

        switch (*format) {
            case PlotFormat::PNG:
            case PlotFormat::JPG:
                write_histogram_raster(h, title, out);
                break;
            case PlotFormat::SVG:
                core::write_text_atomic(out, render_histogram_svg(h, title, "error (deg)"));
                break;
            case PlotFormat::PDF: {
                fs::path svg = out;
                svg.replace_extension(".svg.tmp");
                core::write_text_atomic(svg, render_histogram_svg(h, title, "error (deg)"));
                const auto argv = runner::expand_command(plot.pdf_converter, svg.string(),
                                                         out.string(), summary.variant_id,
                                                         plots_dir.string());
                const runner::ProcessResult pr =
                    runner::ProcessRunner().run(argv, kConverterTimeoutMs);
                std::error_code ec;
                fs::remove(svg, ec);
                if (!pr.started || pr.timed_out || pr.exit_code != 0) {
                    throw StageError("pdf conversion failed for " + out.string() + ": " +
                                     (pr.started ? core::trim(runner::tail_text(pr.output, 300))
                                                 : pr.error_message));
                }
                break;
            }
        }
        written.push_back(out);
    }
    return written;
}

} // namespace arm_angle::analysis
