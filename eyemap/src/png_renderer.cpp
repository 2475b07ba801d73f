#include <eyemap/color_palette.hpp>
#include <eyemap/log.hpp>
#include <eyemap/png_renderer.hpp>
#include <png.h>
#include <algorithm>
#include <cmath>
#include <new>

namespace eyemap {

namespace {

constexpr const char* PNG_DATA_URI_PREFIX = "data:image/png;base64,";
constexpr double OUTLINE_SHADE = 0.7;

Color darker(Color c) {
    return Color{static_cast<std::uint8_t>(c.r * OUTLINE_SHADE),
                 static_cast<std::uint8_t>(c.g * OUTLINE_SHADE),
                 static_cast<std::uint8_t>(c.b * OUTLINE_SHADE)};
}

double cross(const PixelPoint& a, const PixelPoint& b, double px, double py) {
    return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
}

// Pixel-center inclusion test against a convex polygon of either winding
void fill_convex(RgbImage& image, const std::array<PixelPoint, 6>& poly, Color color) {
    double min_x = poly[0].x, max_x = poly[0].x, min_y = poly[0].y, max_y = poly[0].y;
    for (const auto& p : poly) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    const int x0 = std::max(0, static_cast<int>(std::floor(min_x)));
    const int x1 = std::min(image.width - 1, static_cast<int>(std::ceil(max_x)));
    const int y0 = std::max(0, static_cast<int>(std::floor(min_y)));
    const int y1 = std::min(image.height - 1, static_cast<int>(std::ceil(max_y)));

    for (int y = y0; y <= y1; ++y) {
        const double py = y + 0.5;
        for (int x = x0; x <= x1; ++x) {
            const double px = x + 0.5;
            bool any_pos = false;
            bool any_neg = false;
            for (std::size_t i = 0; i < poly.size(); ++i) {
                const double c = cross(poly[i], poly[(i + 1) % poly.size()], px, py);
                any_pos |= c > 0.0;
                any_neg |= c < 0.0;
            }
            if (!(any_pos && any_neg)) {
                image.set(x, y, color);
            }
        }
    }
}

void draw_line(RgbImage& image, PixelPoint a, PixelPoint b, Color color) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const int steps = std::max(1, static_cast<int>(std::ceil(std::max(std::fabs(dx), std::fabs(dy)))));
    for (int i = 0; i <= steps; ++i) {
        const double t = static_cast<double>(i) / steps;
        image.set(static_cast<int>(std::floor(a.x + dx * t)), static_cast<int>(std::floor(a.y + dy * t)), color);
    }
}

void fill_rect(RgbImage& image, double x, double y, double w, double h, Color color) {
    const int x0 = std::max(0, static_cast<int>(std::floor(x)));
    const int y0 = std::max(0, static_cast<int>(std::floor(y)));
    const int x1 = std::min(image.width, static_cast<int>(std::ceil(x + w)));
    const int y1 = std::min(image.height, static_cast<int>(std::ceil(y + h)));
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            image.set(px, py, color);
        }
    }
}

void on_png_error(png_structp png, png_const_charp message) {
    EYEMAP_LOG_ERROR("libpng: %s", message);
    png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp message) {
    EYEMAP_LOG_WARN("libpng: %s", message);
}

struct PngBuffer {
    std::string bytes;
    bool out_of_memory = false;
};

// Never unwinds through libpng; allocation failure is reported after png_write_end
void write_to_buffer(png_structp png, png_bytep data, png_size_t length) {
    auto* buffer = static_cast<PngBuffer*>(png_get_io_ptr(png));
    if (buffer->out_of_memory) return;
    try {
        buffer->bytes.append(reinterpret_cast<const char*>(data), length);
    } catch (const std::bad_alloc&) {
        buffer->out_of_memory = true;
    }
}

void flush_buffer(png_structp) {}

} // namespace

RgbImage::RgbImage(int w, int h, Color fill)
    : width(w), height(h), pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3) {
    for (std::size_t i = 0; i < pixels.size(); i += 3) {
        pixels[i] = fill.r;
        pixels[i + 1] = fill.g;
        pixels[i + 2] = fill.b;
    }
}

Color RgbImage::at(int x, int y) const {
    const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
    return Color{pixels[i], pixels[i + 1], pixels[i + 2]};
}

void RgbImage::set(int x, int y, Color color) {
    if (x < 0 || y < 0 || x >= width || y >= height) return;
    const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
    pixels[i] = color.r;
    pixels[i + 1] = color.g;
    pixels[i + 2] = color.b;
}

PngRenderer::PngRenderer(double scale, CoordinateSystem coordinates)
    : scale_(scale), coordinates_(coordinates) {}

RgbImage PngRenderer::rasterize(const HexagonGrid& grid, const LayoutConfig& layout,
                                const LegendConfig& legend) const {
    const int width = std::max(1, static_cast<int>(std::ceil(layout.width * scale_)));
    const int height = std::max(1, static_cast<int>(std::ceil(layout.height * scale_)));
    RgbImage image(width, height, colors::BACKGROUND);

    for (const auto& hexagon : grid.hexagons) {
        auto points = coordinates_.hexagon_points((hexagon.pixel_x + layout.offset_x) * scale_,
                                                  (hexagon.pixel_y + layout.offset_y) * scale_,
                                                  layout.hex_size * scale_);
        fill_convex(image, points, hexagon.color);

        const Color edge = darker(hexagon.color);
        for (std::size_t i = 0; i < points.size(); ++i) {
            draw_line(image, points[i], points[(i + 1) % points.size()], edge);
        }
    }

    for (const auto& swatch : legend.swatches) {
        fill_rect(image, layout.legend_x * scale_, swatch.y * scale_,
                  layout.legend_width * scale_, swatch.height * scale_, swatch.color);
    }

    return image;
}

Result<std::string> PngRenderer::render(const HexagonGrid& grid, const LayoutConfig& layout,
                                        const LegendConfig& legend) const {
    const double width = std::ceil(layout.width * scale_);
    const double height = std::ceil(layout.height * scale_);
    if (!(width <= MAX_RASTER_DIMENSION) || !(height <= MAX_RASTER_DIMENSION)) {
        Error e = make_error(ErrorKind::Rendering, "raster exceeds the maximum size", "png_rasterize");
        e.field = "png_scale";
        e.value = std::to_string(scale_);
        return e;
    }

    try {
        RgbImage image = rasterize(grid, layout, legend);
        EYEMAP_LOG_DEBUG("Rasterized %s_%s to %dx%d", grid.region.c_str(), short_label(grid.side),
                         image.width, image.height);
        return encode(image);
    } catch (const std::bad_alloc&) {
        return make_error(ErrorKind::Rendering, "out of memory while rasterizing", "png_rasterize");
    }
}

Result<std::string> PngRenderer::encode(const RgbImage& image) {
    const char* op = "png_encoding";

    if (image.width <= 0 || image.height <= 0) {
        return make_error(ErrorKind::Rendering, "cannot encode an empty image", op);
    }

    PngBuffer buffer;
    std::vector<png_bytep> rows(static_cast<std::size_t>(image.height));
    for (int y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(&image.pixels[static_cast<std::size_t>(y) * image.width * 3]);
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
    if (png == nullptr) {
        return make_error(ErrorKind::Rendering, "png_create_write_struct failed", op);
    }
    png_infop info = png_create_info_struct(png);
    if (info == nullptr) {
        png_destroy_write_struct(&png, nullptr);
        return make_error(ErrorKind::Rendering, "png_create_info_struct failed", op);
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return make_error(ErrorKind::Rendering, "libpng failed while encoding", op);
    }

    png_set_write_fn(png, &buffer, write_to_buffer, flush_buffer);
    png_set_IHDR(png, info, static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height), 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    if (buffer.out_of_memory) {
        return make_error(ErrorKind::Rendering, "out of memory while buffering PNG output", op);
    }
    return std::move(buffer.bytes);
}

std::string PngRenderer::base64_encode(const std::string& bytes) {
    static const char* ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const std::uint32_t n = (static_cast<std::uint8_t>(bytes[i]) << 16) |
                                (static_cast<std::uint8_t>(bytes[i + 1]) << 8) |
                                static_cast<std::uint8_t>(bytes[i + 2]);
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += ALPHABET[(n >> 6) & 0x3f];
        out += ALPHABET[n & 0x3f];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint8_t>(bytes[i]) << 16;
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint8_t>(bytes[i]) << 16) |
                                (static_cast<std::uint8_t>(bytes[i + 1]) << 8);
        out += ALPHABET[(n >> 18) & 0x3f];
        out += ALPHABET[(n >> 12) & 0x3f];
        out += ALPHABET[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

std::string PngRenderer::to_data_uri(const std::string& png_bytes) {
    return PNG_DATA_URI_PREFIX + base64_encode(png_bytes);
}

} // namespace eyemap
