/**
 * OpenGL draw adapter implementation
 */

#define GL_GLEXT_PROTOTYPES
#include "petalite/render/opengl/gl_draw_adapter.hpp"
#include "petalite/core/logger.hpp"
#include <GL/gl.h>
#include <GL/glext.h>
#include <cstddef>
#include <string>

namespace petalite::render::opengl {

namespace {

constexpr const char* VERTEX_SHADER = R"(#version 330 core
layout(location = 0) in vec4 a_screen_rect;
layout(location = 1) in vec4 a_uv_rect;
layout(location = 2) in vec4 a_color;
layout(location = 3) in uint a_layer;

uniform vec2 u_surface_size;

out vec3 v_uv;
out vec4 v_color;

const vec2 CORNERS[6] = vec2[6](
    vec2(0.0, 0.0), vec2(1.0, 0.0), vec2(0.0, 1.0),
    vec2(1.0, 0.0), vec2(1.0, 1.0), vec2(0.0, 1.0));

void main() {
    vec2 corner = CORNERS[gl_VertexID];
    vec2 pixel = a_screen_rect.xy + corner * a_screen_rect.zw;
    vec2 ndc = pixel / u_surface_size * 2.0 - 1.0;
    gl_Position = vec4(ndc.x, -ndc.y, 0.0, 1.0);
    v_uv = vec3(a_uv_rect.xy + corner * a_uv_rect.zw, float(a_layer));
    v_color = a_color;
}
)";

constexpr const char* FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2DArray u_atlas;

in vec3 v_uv;
in vec4 v_color;

out vec4 frag_color;

void main() {
    float coverage = texture(u_atlas, v_uv).r;
    frag_color = vec4(v_color.rgb, v_color.a * coverage);
}
)";

Result<GLuint, DrawError> compile_shader(GLenum stage, const char* source) {
    GLuint shader = glCreateShader(stage);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<usize>(length > 0 ? length : 1), '\0');
        glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
        PETALITE_LOG_ERROR_FMT("Glyph shader compilation failed: {}", log);
        glDeleteShader(shader);
        return make_error(DrawError::CompilationFailed);
    }
    return shader;
}

GLuint create_layer_texture(u32 width, u32 height, u32 layers) {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D_ARRAY, texture);
    glTexImage3D(GL_TEXTURE_2D_ARRAY, 0, GL_R8,
                 static_cast<GLsizei>(width), static_cast<GLsizei>(height),
                 static_cast<GLsizei>(layers), 0, GL_RED, GL_UNSIGNED_BYTE, nullptr);
    glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D_ARRAY, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    return texture;
}

} // anonymous namespace

// ============================================================================
// Lifetime
// ============================================================================

Result<std::unique_ptr<GLDrawAdapter>, DrawError> GLDrawAdapter::create() {
    std::unique_ptr<GLDrawAdapter> adapter(new GLDrawAdapter());
    auto initialized = adapter->initialize();
    if (initialized.is_err()) {
        return make_error(initialized.error());
    }
    return adapter;
}

Result<void, DrawError> GLDrawAdapter::initialize() {
    const GLubyte* version = glGetString(GL_VERSION);
    if (!version) {
        PETALITE_LOG_ERROR("No current OpenGL context");
        return make_error(DrawError::NotSupported);
    }
    PETALITE_LOG_INFO_FMT("OpenGL draw adapter on {}", reinterpret_cast<const char*>(version));

    auto vertex = compile_shader(GL_VERTEX_SHADER, VERTEX_SHADER);
    if (vertex.is_err()) {
        return make_error(vertex.error());
    }
    auto fragment = compile_shader(GL_FRAGMENT_SHADER, FRAGMENT_SHADER);
    if (fragment.is_err()) {
        glDeleteShader(vertex.value());
        return make_error(fragment.error());
    }

    m_program = glCreateProgram();
    glAttachShader(m_program, vertex.value());
    glAttachShader(m_program, fragment.value());
    glLinkProgram(m_program);
    glDeleteShader(vertex.value());
    glDeleteShader(fragment.value());

    GLint status = GL_FALSE;
    glGetProgramiv(m_program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetProgramiv(m_program, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<usize>(length > 0 ? length : 1), '\0');
        glGetProgramInfoLog(m_program, static_cast<GLsizei>(log.size()), nullptr, log.data());
        PETALITE_LOG_ERROR_FMT("Glyph shader linking failed: {}", log);
        return make_error(DrawError::LinkingFailed);
    }

    m_surface_location = glGetUniformLocation(m_program, "u_surface_size");
    m_atlas_location = glGetUniformLocation(m_program, "u_atlas");

    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_instance_buffer);

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_instance_buffer);
    constexpr GLsizei stride = sizeof(DrawInstance);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 4, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(offsetof(DrawInstance, screen_rect)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(offsetof(DrawInstance, uv_rect)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, stride,
                          reinterpret_cast<const void*>(offsetof(DrawInstance, color)));
    glEnableVertexAttribArray(3);
    glVertexAttribIPointer(3, 1, GL_UNSIGNED_INT, stride,
                           reinterpret_cast<const void*>(offsetof(DrawInstance, layer)));
    for (GLuint attribute = 0; attribute < 4; ++attribute) {
        glVertexAttribDivisor(attribute, 1);
    }
    glBindVertexArray(0);

    return {};
}

GLDrawAdapter::~GLDrawAdapter() {
    release_atlases();
    if (m_instance_buffer) {
        glDeleteBuffers(1, &m_instance_buffer);
    }
    if (m_vao) {
        glDeleteVertexArrays(1, &m_vao);
    }
    if (m_program) {
        glDeleteProgram(m_program);
    }
}

void GLDrawAdapter::release_atlases() {
    for (auto& atlas : m_atlases) {
        if (atlas.texture) {
            glDeleteTextures(1, &atlas.texture);
        }
    }
    m_atlases.clear();
}

// ============================================================================
// DrawAdapter
// ============================================================================

void GLDrawAdapter::begin_frame(const FrameGlobals& globals) {
    m_surface_size = globals.surface_size;

    if (m_atlases.size() < globals.atlases.size()) {
        m_atlases.resize(globals.atlases.size());
    }
    for (const auto& desc : globals.atlases) {
        AtlasTexture& atlas = m_atlases[desc.atlas];
        if (atlas.texture && atlas.texture_size == desc.texture_size && atlas.layers == desc.layers) {
            continue;
        }
        if (atlas.texture) {
            glDeleteTextures(1, &atlas.texture);
        }
        atlas.texture = create_layer_texture(desc.texture_size, desc.texture_size, desc.layers);
        atlas.texture_size = desc.texture_size;
        atlas.layers = desc.layers;
        PETALITE_LOG_DEBUG_FMT("Created glyph atlas {}: {}x{}x{}", desc.atlas,
                               desc.texture_size, desc.texture_size, desc.layers);
    }

    glUseProgram(m_program);
    glUniform2f(m_surface_location, m_surface_size.width, m_surface_size.height);
    glUniform1i(m_atlas_location, 0);
    glActiveTexture(GL_TEXTURE0);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}

void GLDrawAdapter::upload(std::span<const cache::AtlasUpload> uploads) {
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    for (const auto& up : uploads) {
        if (up.atlas >= m_atlases.size() || !m_atlases[up.atlas].texture) {
            PETALITE_LOG_ERROR_FMT("Upload to unknown atlas {}", up.atlas);
            continue;
        }
        glBindTexture(GL_TEXTURE_2D_ARRAY, m_atlases[up.atlas].texture);
        glTexSubImage3D(GL_TEXTURE_2D_ARRAY, 0,
                        static_cast<GLint>(up.x), static_cast<GLint>(up.y), static_cast<GLint>(up.layer),
                        static_cast<GLsizei>(up.width), static_cast<GLsizei>(up.height), 1,
                        GL_RED, GL_UNSIGNED_BYTE, up.coverage.data());
    }
}

void GLDrawAdapter::draw(const DrawBatch& batch) {
    if (batch.atlas >= m_atlases.size() || !m_atlases[batch.atlas].texture) {
        PETALITE_LOG_ERROR_FMT("Draw from unknown atlas {}", batch.atlas);
        return;
    }
    draw_instances(m_atlases[batch.atlas].texture, batch.instances);
}

void GLDrawAdapter::draw_standalone(const StandaloneGlyph& glyph) {
    GLuint texture = create_layer_texture(glyph.width, glyph.height, 1);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage3D(GL_TEXTURE_2D_ARRAY, 0, 0, 0, 0,
                    static_cast<GLsizei>(glyph.width), static_cast<GLsizei>(glyph.height), 1,
                    GL_RED, GL_UNSIGNED_BYTE, glyph.coverage.data());

    DrawInstance instance{};
    instance.screen_rect[0] = glyph.screen_rect.x;
    instance.screen_rect[1] = glyph.screen_rect.y;
    instance.screen_rect[2] = glyph.screen_rect.width;
    instance.screen_rect[3] = glyph.screen_rect.height;
    instance.uv_rect[2] = 1.0f;
    instance.uv_rect[3] = 1.0f;
    instance.color[0] = glyph.color.r;
    instance.color[1] = glyph.color.g;
    instance.color[2] = glyph.color.b;
    instance.color[3] = glyph.color.a;

    draw_instances(texture, std::span<const DrawInstance>(&instance, 1));
    glDeleteTextures(1, &texture);
}

void GLDrawAdapter::end_frame() {
    glBindVertexArray(0);
    glUseProgram(0);
    glFlush();
}

void GLDrawAdapter::draw_instances(u32 texture, std::span<const DrawInstance> instances) {
    if (instances.empty()) {
        return;
    }

    const usize bytes = instances.size_bytes();
    glBindBuffer(GL_ARRAY_BUFFER, m_instance_buffer);
    if (bytes > m_instance_capacity) {
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes), instances.data(), GL_STREAM_DRAW);
        m_instance_capacity = bytes;
    } else {
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes), instances.data());
    }

    glBindVertexArray(m_vao);
    glBindTexture(GL_TEXTURE_2D_ARRAY, texture);
    glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(instances.size()));
}

} // namespace petalite::render::opengl
