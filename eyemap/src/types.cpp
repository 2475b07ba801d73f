#include <eyemap/requests.hpp>
#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>

namespace eyemap {

namespace {

std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::DataProcessing: return "DataProcessingError";
        case ErrorKind::Rendering: return "RenderingError";
        case ErrorKind::Performance: return "PerformanceError";
    }
    return "Error";
}

std::string Error::to_string() const {
    std::string out = error_kind_name(kind);
    if (!operation.empty()) {
        out += " in " + operation;
    }
    out += ": " + message;
    if (!field.empty()) {
        out += " (field=" + field;
        if (!value.empty()) {
            out += ", value=" + value;
        }
        out += ")";
    }
    return out;
}

const char* to_string(Hemisphere side) {
    return side == Hemisphere::Left ? "left" : "right";
}

const char* to_string(SomaSide side) {
    switch (side) {
        case SomaSide::Left: return "left";
        case SomaSide::Right: return "right";
        case SomaSide::Combined: return "combined";
    }
    return "unknown";
}

const char* to_string(MetricType metric) {
    switch (metric) {
        case MetricType::SynapseDensity: return "synapse_density";
        case MetricType::CellCount: return "cell_count";
    }
    return "unknown";
}

const char* to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Svg: return "svg";
        case OutputFormat::Png: return "png";
    }
    return "unknown";
}

const char* to_string(ColumnStatus status) {
    switch (status) {
        case ColumnStatus::HasData: return "has_data";
        case ColumnStatus::NoData: return "no_data";
        case ColumnStatus::NotInRegion: return "not_in_region";
    }
    return "unknown";
}

const char* short_label(Hemisphere side) {
    return side == Hemisphere::Left ? "L" : "R";
}

std::vector<Hemisphere> sides_for(SomaSide side) {
    switch (side) {
        case SomaSide::Left: return {Hemisphere::Left};
        case SomaSide::Right: return {Hemisphere::Right};
        case SomaSide::Combined: return {Hemisphere::Left, Hemisphere::Right};
    }
    return {};
}

Result<SomaSide> parse_soma_side(const std::string& text) {
    const std::string key = lowercase(text);
    if (key == "left" || key == "l") return SomaSide::Left;
    if (key == "right" || key == "r") return SomaSide::Right;
    if (key == "combined" || key == "c") return SomaSide::Combined;
    return make_validation_error("unknown soma side", "soma_side", text, "parse_soma_side");
}

Result<MetricType> parse_metric_type(const std::string& text) {
    const std::string key = lowercase(text);
    if (key == "synapse_density") return MetricType::SynapseDensity;
    if (key == "cell_count") return MetricType::CellCount;
    return make_validation_error("unknown metric type", "metric_type", text, "parse_metric_type");
}

Result<OutputFormat> parse_output_format(const std::string& text) {
    const std::string key = lowercase(text);
    if (key == "svg") return OutputFormat::Svg;
    if (key == "png") return OutputFormat::Png;
    return make_validation_error("unknown output format", "output_format", text, "parse_output_format");
}

const std::vector<MetricType>& all_metric_types() {
    static const std::vector<MetricType> metrics = {MetricType::SynapseDensity, MetricType::CellCount};
    return metrics;
}

std::string Color::to_hex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
    return buffer;
}

std::vector<std::string> GridGenerationRequest::regions() const {
    std::vector<std::string> ordered;
    std::set<std::string> seen;
    for (const auto& column : all_possible_columns) {
        if (seen.insert(column.region).second) {
            ordered.push_back(column.region);
        }
    }
    return ordered;
}

std::string RegionSideKey::to_string() const {
    return region + "_" + short_label(side);
}

} // namespace eyemap
