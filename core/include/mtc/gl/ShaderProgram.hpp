#pragma once
#include <glad/gl.h>
#include <string>
#include <unordered_map>

namespace mtc {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (log goes to stderr).
  bool build(const char* name, const char* vertSrc, const char* fragSrc);

  void use() const;
  bool valid() const { return program_ != 0; }

  GLint attrib(const char* name) const;
  // Looked up once per name.
  GLint uniform(const char* name);

  void setMat3(const char* name, const float* data);
  void setVec4(const char* name, float x, float y, float z, float w);
  void setVec2(const char* name, float x, float y);
  void setFloat(const char* name, float v);
  void setInt(const char* name, int v);

  GLuint id() const { return program_; }

private:
  GLuint program_{0};
  std::string name_;
  std::unordered_map<std::string, GLint> uniforms_;
};

} // namespace mtc
