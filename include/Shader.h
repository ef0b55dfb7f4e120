#pragma once

#include <string>

#include <glm/glm.hpp>

// GLSL program built from a vertex and a fragment source file.
// Throws std::runtime_error when a file is unreadable or compilation/linking fails.
class Shader {
public:
    Shader(const std::string& vertexPath, const std::string& fragmentPath);
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;

    void use() const;

    void setBool(const std::string& name, bool value) const;
    void setInt(const std::string& name, int value) const;
    void setVec3(const std::string& name, const glm::vec3& value) const;
    void setMat4(const std::string& name, const glm::mat4& value) const;

private:
    static std::string readSource(const std::string& path);
    static unsigned int compileStage(unsigned int type, const std::string& source, const std::string& path);

    unsigned int program{0};
};
