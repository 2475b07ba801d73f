#ifndef EYEMAP_CONFIG_HPP
#define EYEMAP_CONFIG_HPP

#include <eyemap/result.hpp>
#include <cstddef>
#include <string>

#ifndef EYEMAP_TEMPLATE_DIR
#define EYEMAP_TEMPLATE_DIR "templates"
#endif

namespace eyemap {

/**
 * Rendering and batch configuration. Plain values with defaults; checked
 * once by validate_config() before any generator is built.
 */
struct EyemapConfig {
    // Geometry (pixels)
    double hex_size = 6.0;
    double spacing_factor = 1.1;
    double margin = 10.0;

    // Output; saved artifacts go to <output_dir>/eyemaps
    std::string output_dir = "output";

    // SVG template
    std::string template_dir = EYEMAP_TEMPLATE_DIR;
    std::string template_name = "eyemap.svg.tmpl";

    // PNG raster scale
    double png_scale = 1.0;

    // Legend
    std::size_t legend_ticks = 5;
    double legend_width = 12.0;
    double legend_height = 60.0;
    double title_height = 40.0;

    // Batch: 0 = hardware concurrency, 1 = inline on the calling thread
    std::size_t worker_threads = 0;
    bool enable_cache = true;
    std::size_t cache_max_entries = 1000;

    std::string eyemaps_dir() const { return output_dir + "/eyemaps"; }
    std::string template_path() const { return template_dir + "/" + template_name; }
};

Status validate_config(const EyemapConfig& config);

} // namespace eyemap

#endif // EYEMAP_CONFIG_HPP
