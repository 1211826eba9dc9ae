#include "mtc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace mtc {

ShaderProgram::~ShaderProgram() {
  if (program_) glDeleteProgram(program_);
}

static GLuint compileShader(const std::string& name, GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram::build: %s %s shader:\n%s\n", name.c_str(),
                 type == GL_VERTEX_SHADER ? "vertex" : "fragment", log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::build(const char* name, const char* vertSrc, const char* fragSrc) {
  name_ = name ? name : "";
  uniforms_.clear();

  GLuint vs = compileShader(name_, GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;
  GLuint fs = compileShader(name_, GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) { glDeleteShader(vs); return false; }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram::build: %s link:\n%s\n", name_.c_str(), log.data());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attrib(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::uniform(const char* name) {
  auto it = uniforms_.find(name);
  if (it != uniforms_.end()) return it->second;
  GLint loc = glGetUniformLocation(program_, name);
  uniforms_.emplace(name, loc);
  return loc;
}

void ShaderProgram::setMat3(const char* name, const float* data) {
  glUniformMatrix3fv(uniform(name), 1, GL_FALSE, data);
}

void ShaderProgram::setVec4(const char* name, float x, float y, float z, float w) {
  glUniform4f(uniform(name), x, y, z, w);
}

void ShaderProgram::setVec2(const char* name, float x, float y) {
  glUniform2f(uniform(name), x, y);
}

void ShaderProgram::setFloat(const char* name, float v) {
  glUniform1f(uniform(name), v);
}

void ShaderProgram::setInt(const char* name, int v) {
  glUniform1i(uniform(name), v);
}

} // namespace mtc
