/**
 * Text Render CLI Tool
 * Usage: petalite-render <font-file> <text> <out.pgm>
 *            [--width W] [--size S] [--align left|center|right|justify]
 *            [--wrap none|word|char]
 */

#include "petalite/cache/cpu_glyph_cache.hpp"
#include "petalite/core/logger.hpp"
#include "petalite/layout/layout_engine.hpp"
#include "petalite/render/cpu_renderer.hpp"
#include "petalite/text/font_storage.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace petalite;

namespace {

struct Options {
    std::string font_path;
    std::string text;
    std::string output_path;
    layout::TextLayoutConfig layout;
    f32 size{24.0f};
};

void print_usage() {
    std::cerr << "Usage: petalite-render <font-file> <text> <out.pgm>\n"
              << "           [--width W] [--size S] [--align left|center|right|justify]\n"
              << "           [--wrap none|word|char]\n";
}

std::optional<f32> parse_positive(std::string_view value) {
    std::string copy(value);
    char* end = nullptr;
    f32 parsed = std::strtof(copy.c_str(), &end);
    if (end == copy.c_str() || *end != '\0' || !(parsed > 0.0f)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<layout::HorizontalAlign> parse_align(std::string_view value) {
    if (value == "left") return layout::HorizontalAlign::Left;
    if (value == "center") return layout::HorizontalAlign::Center;
    if (value == "right") return layout::HorizontalAlign::Right;
    if (value == "justify") return layout::HorizontalAlign::Justify;
    return std::nullopt;
}

std::optional<layout::WrapStyle> parse_wrap(std::string_view value) {
    if (value == "none") return layout::WrapStyle::NoWrap;
    if (value == "word") return layout::WrapStyle::WordWrap;
    if (value == "char") return layout::WrapStyle::CharWrap;
    return std::nullopt;
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.starts_with("--")) {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                return std::nullopt;
            }
            std::string_view value = argv[++i];

            if (arg == "--width") {
                auto width = parse_positive(value);
                if (!width) {
                    std::cerr << "Error: Invalid width: " << value << "\n";
                    return std::nullopt;
                }
                options.layout.max_width = *width;
            } else if (arg == "--size") {
                auto size = parse_positive(value);
                if (!size) {
                    std::cerr << "Error: Invalid size: " << value << "\n";
                    return std::nullopt;
                }
                options.size = *size;
            } else if (arg == "--align") {
                auto align = parse_align(value);
                if (!align) {
                    std::cerr << "Error: Unknown alignment: " << value << "\n";
                    return std::nullopt;
                }
                options.layout.horizontal_align = *align;
            } else if (arg == "--wrap") {
                auto wrap = parse_wrap(value);
                if (!wrap) {
                    std::cerr << "Error: Unknown wrap style: " << value << "\n";
                    return std::nullopt;
                }
                options.layout.wrap_style = *wrap;
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                return std::nullopt;
            }
            continue;
        }

        switch (positional++) {
            case 0: options.font_path = arg; break;
            case 1: options.text = arg; break;
            case 2: options.output_path = arg; break;
            default:
                std::cerr << "Error: Unexpected argument: " << arg << "\n";
                return std::nullopt;
        }
    }

    if (positional < 3) {
        return std::nullopt;
    }
    return options;
}

bool write_pgm(const std::string& path, const render::CoverageBitmap& bitmap) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file << "P5\n" << bitmap.width() << " " << bitmap.height() << "\n255\n";
    file.write(reinterpret_cast<const char*>(bitmap.pixels().data()),
               static_cast<std::streamsize>(bitmap.pixels().size()));
    return static_cast<bool>(file);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        logging::shutdown();
        return 1;
    }

    text::FontStorage fonts;
    auto font = fonts.load_font_file(options->font_path);
    if (font.is_err()) {
        std::cerr << "Error: Cannot load font " << options->font_path << ": "
                  << text::to_string(font.error()) << "\n";
        logging::shutdown();
        return 1;
    }

    layout::TextData<layout::NoPayload> data;
    data.append(options->text, font.value(), options->size);

    layout::LayoutEngine engine(fonts);
    auto result = engine.layout(data, options->layout);

    auto cache = cache::CpuGlyphCache::create({{1024, 256}, {16384, 64}}, fonts);
    if (cache.is_err()) {
        std::cerr << "Error: " << cache::to_string(cache.error()) << "\n";
        logging::shutdown();
        return 1;
    }

    f32 width = std::max(options->layout.max_width.value_or(0.0f), result.total_width);
    auto image_width = static_cast<u32>(std::ceil(width)) + 2;
    auto image_height = static_cast<u32>(std::ceil(result.total_height));
    render::CoverageBitmap bitmap(std::max(image_width, 1u), std::max(image_height, 1u));

    render::CpuRenderer renderer(*cache.value());
    auto stats = renderer.render_coverage(result, bitmap);

    if (!write_pgm(options->output_path, bitmap)) {
        std::cerr << "Error: Cannot write " << options->output_path << "\n";
        logging::shutdown();
        return 1;
    }

    std::cout << "Lines: " << result.lines.size() << "\n";
    std::cout << "Glyphs: " << result.glyph_count() << " (" << stats.drawn << " drawn, "
              << stats.failed << " failed)\n";
    std::cout << "Size: " << bitmap.width() << "x" << bitmap.height() << "\n";

    logging::shutdown();
    return 0;
}
