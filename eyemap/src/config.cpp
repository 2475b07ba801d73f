#include <eyemap/config.hpp>
#include <cmath>
#include <initializer_list>
#include <string>

namespace eyemap {

namespace {

Status require_positive(double value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) {
        return make_validation_error("must be a positive finite number", field,
                                     std::to_string(value), "validate_config");
    }
    return ok_status();
}

} // namespace

Status validate_config(const EyemapConfig& config) {
    for (const auto& check : {require_positive(config.hex_size, "hex_size"),
                              require_positive(config.spacing_factor, "spacing_factor"),
                              require_positive(config.png_scale, "png_scale"),
                              require_positive(config.legend_width, "legend_width"),
                              require_positive(config.legend_height, "legend_height")}) {
        if (!check) return check;
    }

    if (!std::isfinite(config.margin) || config.margin < 0.0) {
        return make_validation_error("must be a non-negative finite number", "margin",
                                     std::to_string(config.margin), "validate_config");
    }
    if (!std::isfinite(config.title_height) || config.title_height < 0.0) {
        return make_validation_error("must be a non-negative finite number", "title_height",
                                     std::to_string(config.title_height), "validate_config");
    }
    if (config.legend_ticks < 2) {
        return make_validation_error("legend needs at least two ticks", "legend_ticks",
                                     std::to_string(config.legend_ticks), "validate_config");
    }
    if (config.enable_cache && config.cache_max_entries == 0) {
        return make_validation_error("cache must hold at least one entry", "cache_max_entries", "0",
                                     "validate_config");
    }
    if (config.template_name.empty()) {
        return make_validation_error("template name cannot be empty", "template_name", "",
                                     "validate_config");
    }
    if (config.output_dir.empty()) {
        return make_validation_error("output directory cannot be empty", "output_dir", "",
                                     "validate_config");
    }
    return ok_status();
}

} // namespace eyemap
