/**
 * Software draw adapter implementation
 */

#include "petalite/render/software_draw_adapter.hpp"
#include "petalite/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace petalite::render {

namespace {

u8 to_unorm(f32 value) {
    return static_cast<u8>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
}

} // anonymous namespace

SoftwareDrawAdapter::SoftwareDrawAdapter(u32 width, u32 height, Color clear_color)
    : m_width(width)
    , m_height(height)
    , m_pixels(static_cast<usize>(width) * height, clear_color)
{
}

void SoftwareDrawAdapter::clear(Color color) {
    std::fill(m_pixels.begin(), m_pixels.end(), color);
}

Color SoftwareDrawAdapter::pixel(u32 x, u32 y) const {
    return m_pixels[static_cast<usize>(y) * m_width + x];
}

u32 SoftwareDrawAdapter::layer_count(u32 atlas) const {
    if (atlas >= m_atlases.size()) {
        return 0;
    }
    return static_cast<u32>(m_atlases[atlas].layers.size());
}

u8 SoftwareDrawAdapter::texel(u32 atlas, u32 layer, u32 x, u32 y) const {
    if (atlas >= m_atlases.size()) {
        return 0;
    }
    const Atlas& a = m_atlases[atlas];
    if (layer >= a.layers.size() || x >= a.texture_size || y >= a.texture_size) {
        return 0;
    }
    return a.layers[layer][static_cast<usize>(y) * a.texture_size + x];
}

// ============================================================================
// DrawAdapter
// ============================================================================

void SoftwareDrawAdapter::begin_frame(const FrameGlobals& globals) {
    m_events.push_back({EventKind::BeginFrame, 0, 0});

    // Texture arrays outlive frames; only a changed descriptor drops one
    if (m_atlases.size() < globals.atlases.size()) {
        m_atlases.resize(globals.atlases.size());
    }
    for (const auto& desc : globals.atlases) {
        Atlas& atlas = m_atlases[desc.atlas];
        if (atlas.texture_size != desc.texture_size || atlas.max_layers != desc.layers) {
            atlas.texture_size = desc.texture_size;
            atlas.max_layers = desc.layers;
            atlas.layers.clear();
        }
    }
}

void SoftwareDrawAdapter::upload(std::span<const cache::AtlasUpload> uploads) {
    for (const auto& up : uploads) {
        m_events.push_back({EventKind::Upload, up.atlas, 1});

        if (up.atlas >= m_atlases.size() || up.layer >= m_atlases[up.atlas].max_layers) {
            PETALITE_LOG_ERROR_FMT("Upload to unknown atlas {} layer {}", up.atlas, up.layer);
            continue;
        }
        Atlas& atlas = m_atlases[up.atlas];
        const usize layer_bytes = static_cast<usize>(atlas.texture_size) * atlas.texture_size;
        while (atlas.layers.size() <= up.layer) {
            atlas.layers.emplace_back(layer_bytes, 0);
        }

        std::vector<u8>& layer = atlas.layers[up.layer];
        for (u32 row = 0; row < up.height && up.y + row < atlas.texture_size; ++row) {
            for (u32 col = 0; col < up.width && up.x + col < atlas.texture_size; ++col) {
                layer[static_cast<usize>(up.y + row) * atlas.texture_size + up.x + col] =
                    up.coverage[static_cast<usize>(row) * up.width + col];
            }
        }
    }
}

void SoftwareDrawAdapter::draw(const DrawBatch& batch) {
    m_events.push_back({EventKind::Draw, batch.atlas, static_cast<u32>(batch.instances.size())});

    if (batch.atlas >= m_atlases.size()) {
        PETALITE_LOG_ERROR_FMT("Draw from unknown atlas {}", batch.atlas);
        return;
    }
    const Atlas& atlas = m_atlases[batch.atlas];
    const auto texture = static_cast<f32>(atlas.texture_size);

    for (const DrawInstance& instance : batch.instances) {
        const auto x0 = static_cast<i32>(std::lround(instance.screen_rect[0]));
        const auto y0 = static_cast<i32>(std::lround(instance.screen_rect[1]));
        const auto w = static_cast<i32>(std::lround(instance.screen_rect[2]));
        const auto h = static_cast<i32>(std::lround(instance.screen_rect[3]));
        const auto u0 = static_cast<u32>(std::lround(instance.uv_rect[0] * texture));
        const auto v0 = static_cast<u32>(std::lround(instance.uv_rect[1] * texture));
        const ColorF color(instance.color[0], instance.color[1], instance.color[2], instance.color[3]);

        for (i32 dy = 0; dy < h; ++dy) {
            for (i32 dx = 0; dx < w; ++dx) {
                u8 coverage = texel(batch.atlas, instance.layer,
                                    u0 + static_cast<u32>(dx), v0 + static_cast<u32>(dy));
                blend(x0 + dx, y0 + dy, color, coverage);
            }
        }
    }
}

void SoftwareDrawAdapter::draw_standalone(const StandaloneGlyph& glyph) {
    m_events.push_back({EventKind::Standalone, 0, 1});

    const auto x0 = static_cast<i32>(std::lround(glyph.screen_rect.x));
    const auto y0 = static_cast<i32>(std::lround(glyph.screen_rect.y));
    for (u32 row = 0; row < glyph.height; ++row) {
        for (u32 col = 0; col < glyph.width; ++col) {
            blend(x0 + static_cast<i32>(col), y0 + static_cast<i32>(row), glyph.color,
                  glyph.coverage[static_cast<usize>(row) * glyph.width + col]);
        }
    }
}

void SoftwareDrawAdapter::end_frame() {
    m_events.push_back({EventKind::EndFrame, 0, 0});
}

void SoftwareDrawAdapter::blend(i32 x, i32 y, const ColorF& color, u8 coverage) {
    if (coverage == 0 || x < 0 || y < 0 ||
        x >= static_cast<i32>(m_width) || y >= static_cast<i32>(m_height)) {
        return;
    }

    Color& dst = m_pixels[static_cast<usize>(y) * m_width + static_cast<usize>(x)];
    const f32 alpha = color.a * (static_cast<f32>(coverage) / 255.0f);
    const f32 keep = 1.0f - alpha;

    dst.r = to_unorm(color.r * alpha + (dst.r / 255.0f) * keep);
    dst.g = to_unorm(color.g * alpha + (dst.g / 255.0f) * keep);
    dst.b = to_unorm(color.b * alpha + (dst.b / 255.0f) * keep);
    dst.a = to_unorm(alpha + (dst.a / 255.0f) * keep);
}

} // namespace petalite::render
