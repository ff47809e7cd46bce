#pragma once

#include "petalite/render/draw_adapter.hpp"
#include <vector>

namespace petalite::render {

/**
 * @brief DrawAdapter that rasterizes instanced quads on the CPU
 *
 * Emulates one single channel texture array per atlas and blends into an
 * RGBA8 target with straight alpha, source over. It follows the shader
 * contract of DrawAdapter with nearest sampling, so the same renderer
 * output can be checked without a GPU. Every call is also recorded as a
 * FrameEvent.
 */
class SoftwareDrawAdapter : public DrawAdapter {
public:
    enum class EventKind : u8 {
        BeginFrame,
        Upload,
        Draw,
        Standalone,
        EndFrame
    };

    struct FrameEvent {
        EventKind kind;
        u32 atlas{0};
        u32 count{0};      // Uploads or instances in the call

        bool operator==(const FrameEvent&) const = default;
    };

    SoftwareDrawAdapter(u32 width, u32 height, Color clear_color = Color::transparent());

    void begin_frame(const FrameGlobals& globals) override;
    void upload(std::span<const cache::AtlasUpload> uploads) override;
    void draw(const DrawBatch& batch) override;
    void draw_standalone(const StandaloneGlyph& glyph) override;
    void end_frame() override;

    [[nodiscard]] u32 width() const { return m_width; }
    [[nodiscard]] u32 height() const { return m_height; }
    [[nodiscard]] Color pixel(u32 x, u32 y) const;

    // Texel of an emulated atlas layer; 0 outside uploaded data
    [[nodiscard]] u8 texel(u32 atlas, u32 layer, u32 x, u32 y) const;

    // Layers allocated so far; grows as uploads touch new layers
    [[nodiscard]] u32 layer_count(u32 atlas) const;

    [[nodiscard]] const std::vector<FrameEvent>& events() const { return m_events; }
    void clear_events() { m_events.clear(); }

    void clear(Color color);

private:
    struct Atlas {
        u32 texture_size{0};
        u32 max_layers{0};
        std::vector<std::vector<u8>> layers;
    };

    void blend(i32 x, i32 y, const ColorF& color, u8 coverage);

    u32 m_width;
    u32 m_height;
    std::vector<Color> m_pixels;
    std::vector<Atlas> m_atlases;
    std::vector<FrameEvent> m_events;
};

} // namespace petalite::render
