#pragma once

#include "petalite/cache/gpu_glyph_cache.hpp"
#include <span>
#include <vector>

namespace petalite::render {

// ============================================================================
// Draw data
// ============================================================================

// Per-frame uniform data
struct FrameGlobals {
    SizeF surface_size;
    std::vector<cache::AtlasDescriptor> atlases;
};

/**
 * @brief One instanced glyph quad
 *
 * Layout matches the per-instance vertex attributes of the glyph shader.
 */
struct DrawInstance {
    f32 screen_rect[4];   // x, y, width, height in pixels, y down
    f32 uv_rect[4];       // u, v, width, height, normalized
    f32 color[4];         // Straight alpha RGBA
    u32 layer;
    u32 pad[3];
};

static_assert(sizeof(DrawInstance) == 64, "DrawInstance must stay tightly packed");

// Instances that sample one texture array
struct DrawBatch {
    u32 atlas{0};
    std::span<const DrawInstance> instances;
};

// Glyph too large for any tier, drawn from its own bitmap
struct StandaloneGlyph {
    u32 width{0};
    u32 height{0};
    std::vector<u8> coverage;
    RectF screen_rect;
    ColorF color;
};

// ============================================================================
// Draw Adapter
// ============================================================================

/**
 * @brief Receives the output of GpuRenderer and issues API calls
 *
 * Within a frame the renderer submits uploads before any draw that
 * samples the uploaded tiles. The adapter owns all synchronization with
 * the device across frames.
 *
 * Shader contract: the vertex stage expands screen_rect and uv_rect to a
 * quad of two triangles and maps pixels to clip space using the surface
 * size; the fragment stage samples the single channel texture array at
 * `layer` and outputs vec4(color.rgb, color.a * coverage).
 */
class DrawAdapter {
public:
    virtual ~DrawAdapter() = default;

    virtual void begin_frame(const FrameGlobals& globals) = 0;
    virtual void upload(std::span<const cache::AtlasUpload> uploads) = 0;
    virtual void draw(const DrawBatch& batch) = 0;
    virtual void draw_standalone(const StandaloneGlyph& glyph) = 0;
    virtual void end_frame() = 0;

protected:
    DrawAdapter() = default;
};

} // namespace petalite::render
