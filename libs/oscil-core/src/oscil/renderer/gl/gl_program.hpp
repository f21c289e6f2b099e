#pragma once

#include "gl_headers.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace oscil::renderer::gl {

/// @brief Result of compiling and linking a shader program.
struct ProgramResult {
    GLuint program = 0;       ///< Program handle. Zero if compilation or linking failed
    std::string errorMessage; ///< Driver info log on failure

    bool Succeeded() const {
        return program != 0;
    }

    static ProgramResult Ok(GLuint program) {
        return {program, ""};
    }

    static ProgramResult Fail(std::string message) {
        return {0, std::move(message)};
    }
};

/// @brief Compiles a vertex and a fragment shader and links them into a program.
///
/// Must be invoked on a thread with a current OpenGL context. Intermediate shader objects are always deleted.
/// @param[in] vertexSource the vertex shader source
/// @param[in] fragmentSource the fragment shader source
/// @return the linked program, or a failed result carrying the info log
ProgramResult CompileProgram(std::string_view vertexSource, std::string_view fragmentSource);

} // namespace oscil::renderer::gl
