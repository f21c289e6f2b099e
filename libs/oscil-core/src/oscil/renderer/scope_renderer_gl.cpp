#include <oscil/renderer/scope_renderer_gl.hpp>

#include <oscil/res/embedded_resources.hpp>

#include <oscil/util/dev_log.hpp>

#include "gl/gl_headers.hpp"
#include "gl/gl_program.hpp"

namespace oscil::renderer {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Renderer-OpenGL";
    };

} // namespace grp

static constexpr const char *kVertexShaderPath = "shaders/scope_line.vert";
static constexpr const char *kFragmentShaderPath = "shaders/scope_line.frag";

// -----------------------------------------------------------------------------
// Renderer context

struct OpenGLScopeRenderer::Context {
    ~Context() {
        Release();
    }

    GLuint program = 0; //< Line shader program
    GLuint vbo = 0;     //< Line strip vertex buffer

    GLint attrPosition = -1; //< a_Position attribute location
    GLint unifColor = -1;    //< u_Color uniform location

    void Release() {
        if (vbo != 0) {
            glDeleteBuffers(1, &vbo);
            vbo = 0;
        }
        if (program != 0) {
            glDeleteProgram(program);
            program = 0;
        }
        attrPosition = -1;
        unifColor = -1;
    }
};

// -----------------------------------------------------------------------------
// Implementation

OpenGLScopeRenderer::OpenGLScopeRenderer()
    : IScopeRenderer(ScopeRendererType::OpenGL)
    , m_context(std::make_unique<Context>()) {}

// GPU resources must be released on the rendering thread through ReleaseResources(); if that did not happen, the
// context is already gone and the handles are simply dropped.
OpenGLScopeRenderer::~OpenGLScopeRenderer() {
    if (m_initialized) {
        devlog::warn<grp::base>("Renderer destroyed without releasing GPU resources");
        m_context->program = 0;
        m_context->vbo = 0;
    }
}

void OpenGLScopeRenderer::Initialize() {
    m_initialized = true;
    m_valid = false;

    const auto vertexSource = res::LoadText(kVertexShaderPath);
    const auto fragmentSource = res::LoadText(kFragmentShaderPath);
    if (!vertexSource || !fragmentSource) {
        devlog::error<grp::base>("Line shader sources are missing from embedded resources");
        return;
    }

    gl::ProgramResult result = gl::CompileProgram(*vertexSource, *fragmentSource);
    if (!result.Succeeded()) {
        devlog::error<grp::base>("Could not build line shader program: {}", result.errorMessage);
        return;
    }

    auto &ctx = *m_context;
    ctx.program = result.program;
    ctx.attrPosition = glGetAttribLocation(ctx.program, "a_Position");
    ctx.unifColor = glGetUniformLocation(ctx.program, "u_Color");
    if (ctx.attrPosition < 0) {
        devlog::error<grp::base>("Line shader program has no a_Position attribute");
        ctx.Release();
        return;
    }

    glGenBuffers(1, &ctx.vbo);
    if (ctx.vbo == 0) {
        devlog::error<grp::base>("Could not create line strip vertex buffer");
        ctx.Release();
        return;
    }

    m_valid = true;

    const GLubyte *rendererName = glGetString(GL_RENDERER);
    devlog::info<grp::base>("OpenGL renderer initialized ({})",
                            rendererName != nullptr ? reinterpret_cast<const char *>(rendererName) : "unknown");
}

void OpenGLScopeRenderer::ReleaseResources() {
    if (m_initialized) {
        m_context->Release();
        m_initialized = false;
        m_valid = false;
    }
}

void OpenGLScopeRenderer::Render(const scope::ScopeState &state, surface::DrawTarget &target) {
    if (!m_initialized) {
        Initialize();
    }

    glViewport(0, 0, static_cast<GLsizei>(target.size.width), static_cast<GLsizei>(target.size.height));

    const scope::Color bg = state.style.backgroundColor.value_or(scope::kTransparent);
    glClearColor(bg.r, bg.g, bg.b, bg.a);
    glClear(GL_COLOR_BUFFER_BIT);

    const scope::LineStrip &strip = state.lineStrip;
    if (!m_valid || strip.lineCount == 0) {
        return;
    }

    auto &ctx = *m_context;
    const scope::Color &fg = state.style.strokeColor;

    glUseProgram(ctx.program);
    glUniform4f(ctx.unifColor, fg.r, fg.g, fg.b, fg.a);
    glLineWidth(state.style.strokeWidth);

    glBindBuffer(GL_ARRAY_BUFFER, ctx.vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(strip.SizeInBytes()), strip.vertices.data(), GL_STREAM_DRAW);

    const GLuint attrPosition = static_cast<GLuint>(ctx.attrPosition);
    glEnableVertexAttribArray(attrPosition);
    glVertexAttribPointer(attrPosition, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float32), nullptr);

    glDrawArrays(GL_LINE_STRIP, 0, static_cast<GLsizei>(strip.lineCount));

    glDisableVertexAttribArray(attrPosition);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glUseProgram(0);
}

} // namespace oscil::renderer
