#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>

namespace arm_angle {

namespace fs = std::filesystem;

using VectorXd = Eigen::VectorXd;

// Pipeline stages in their fixed execution order
enum class Stage {
    EXTRACT = 0,
    LABEL = 1,
    MEASURE = 2,
    EXPORT = 3
};

// Per-unit stages; EXPORT runs once over the whole store
constexpr std::array<Stage, 3> kUnitStages{Stage::EXTRACT, Stage::LABEL, Stage::MEASURE};
constexpr std::array<Stage, 4> kAllStages{Stage::EXTRACT, Stage::LABEL, Stage::MEASURE,
                                          Stage::EXPORT};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::EXTRACT: return "extract";
        case Stage::LABEL: return "label";
        case Stage::MEASURE: return "measure";
        case Stage::EXPORT: return "export";
        default: return "unknown";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

inline std::optional<Stage> string_to_stage(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "extract") return Stage::EXTRACT;
    if (norm == "label") return Stage::LABEL;
    if (norm == "measure") return Stage::MEASURE;
    if (norm == "export") return Stage::EXPORT;
    return std::nullopt;
}

// Furthest contiguous stage completed for a unit
enum class UnitLifecycle {
    RAW,
    EXTRACTED,
    LABELED,
    MEASURED
};

inline std::string lifecycle_to_string(UnitLifecycle state) {
    switch (state) {
        case UnitLifecycle::RAW: return "raw";
        case UnitLifecycle::EXTRACTED: return "extracted";
        case UnitLifecycle::LABELED: return "labeled";
        case UnitLifecycle::MEASURED: return "measured";
        default: return "unknown";
    }
}

// Plot output format
enum class PlotFormat {
    PNG,
    SVG,
    PDF,
    JPG
};

inline std::string plot_format_to_string(PlotFormat format) {
    switch (format) {
        case PlotFormat::PNG: return "png";
        case PlotFormat::SVG: return "svg";
        case PlotFormat::PDF: return "pdf";
        case PlotFormat::JPG: return "jpg";
        default: return "png";
    }
}

inline std::optional<PlotFormat> string_to_plot_format(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "png") return PlotFormat::PNG;
    if (norm == "svg") return PlotFormat::SVG;
    if (norm == "pdf") return PlotFormat::PDF;
    if (norm == "jpg" || norm == "jpeg") return PlotFormat::JPG;
    return std::nullopt;
}

} // namespace arm_angle
