#pragma once

#include "petalite/render/draw_adapter.hpp"
#include <memory>
#include <vector>

namespace petalite::render::opengl {

// ============================================================================
// Errors
// ============================================================================

enum class DrawError {
    CompilationFailed,
    LinkingFailed,
    NotSupported
};

[[nodiscard]] constexpr const char* to_string(DrawError error) {
    switch (error) {
        case DrawError::CompilationFailed: return "CompilationFailed";
        case DrawError::LinkingFailed: return "LinkingFailed";
        case DrawError::NotSupported: return "NotSupported";
    }
    return "Unknown";
}

// ============================================================================
// OpenGL Draw Adapter
// ============================================================================

/**
 * @brief DrawAdapter for an OpenGL 3.3 core context
 *
 * Each atlas is an R8 GL_TEXTURE_2D_ARRAY with one layer per page. Glyphs
 * are drawn as instanced quads expanded from gl_VertexID, six vertices per
 * instance. The caller owns the context and must keep it current on the
 * calling thread for the adapter's whole lifetime.
 */
class GLDrawAdapter : public DrawAdapter {
public:
    [[nodiscard]] static Result<std::unique_ptr<GLDrawAdapter>, DrawError> create();

    ~GLDrawAdapter() override;

    GLDrawAdapter(const GLDrawAdapter&) = delete;
    GLDrawAdapter& operator=(const GLDrawAdapter&) = delete;

    void begin_frame(const FrameGlobals& globals) override;
    void upload(std::span<const cache::AtlasUpload> uploads) override;
    void draw(const DrawBatch& batch) override;
    void draw_standalone(const StandaloneGlyph& glyph) override;
    void end_frame() override;

private:
    struct AtlasTexture {
        u32 texture{0};
        u32 texture_size{0};
        u32 layers{0};
    };

    GLDrawAdapter() = default;

    [[nodiscard]] Result<void, DrawError> initialize();
    void release_atlases();
    void draw_instances(u32 texture, std::span<const DrawInstance> instances);

    u32 m_program{0};
    u32 m_vao{0};
    u32 m_instance_buffer{0};
    usize m_instance_capacity{0};
    i32 m_surface_location{-1};
    i32 m_atlas_location{-1};
    SizeF m_surface_size;
    std::vector<AtlasTexture> m_atlases;
};

} // namespace petalite::render::opengl
