#include "gl_program.hpp"

#include <fmt/format.h>

#include <utility>

namespace oscil::renderer::gl {

static std::string GetShaderInfoLog(GLuint shader) {
    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    if (length <= 0) {
        return {};
    }
    std::string log(static_cast<size_t>(length), '\0');
    glGetShaderInfoLog(shader, length, nullptr, log.data());
    log.resize(log.find_last_not_of('\0') + 1);
    return log;
}

static std::string GetProgramInfoLog(GLuint program) {
    GLint length = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
    if (length <= 0) {
        return {};
    }
    std::string log(static_cast<size_t>(length), '\0');
    glGetProgramInfoLog(program, length, nullptr, log.data());
    log.resize(log.find_last_not_of('\0') + 1);
    return log;
}

static std::string_view GetShaderTypeName(GLenum type) {
    switch (type) {
    case GL_VERTEX_SHADER: return "vertex";
    case GL_FRAGMENT_SHADER: return "fragment";
    default: return "unknown";
    }
}

// Returns 0 and fills errorMessage on failure.
static GLuint CompileShader(GLenum type, std::string_view source, std::string &errorMessage) {
    const GLuint shader = glCreateShader(type);
    if (shader == 0) {
        errorMessage = fmt::format("could not create {} shader", GetShaderTypeName(type));
        return 0;
    }

    const GLchar *text = source.data();
    const GLint length = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &text, &length);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status == GL_FALSE) {
        errorMessage = fmt::format("{} shader compilation failed: {}", GetShaderTypeName(type), GetShaderInfoLog(shader));
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

ProgramResult CompileProgram(std::string_view vertexSource, std::string_view fragmentSource) {
    std::string errorMessage{};

    const GLuint vertexShader = CompileShader(GL_VERTEX_SHADER, vertexSource, errorMessage);
    if (vertexShader == 0) {
        return ProgramResult::Fail(std::move(errorMessage));
    }

    const GLuint fragmentShader = CompileShader(GL_FRAGMENT_SHADER, fragmentSource, errorMessage);
    if (fragmentShader == 0) {
        glDeleteShader(vertexShader);
        return ProgramResult::Fail(std::move(errorMessage));
    }

    const GLuint program = glCreateProgram();
    if (program == 0) {
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        return ProgramResult::Fail("could not create program");
    }

    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    // The program keeps the compiled code; the shader objects are no longer needed
    glDetachShader(program, vertexShader);
    glDetachShader(program, fragmentShader);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    if (status == GL_FALSE) {
        std::string log = GetProgramInfoLog(program);
        glDeleteProgram(program);
        return ProgramResult::Fail(fmt::format("program link failed: {}", log));
    }

    return ProgramResult::Ok(program);
}

} // namespace oscil::renderer::gl
