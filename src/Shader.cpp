#include "Shader.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iostream>

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

Shader::Shader(const std::string& vertexPath, const std::string& fragmentPath) {
    const std::string vertexSource = readSource(vertexPath);
    const std::string fragmentSource = readSource(fragmentPath);

    unsigned int vertex = compileStage(GL_VERTEX_SHADER, vertexSource, vertexPath);
    unsigned int fragment = 0;
    try {
        fragment = compileStage(GL_FRAGMENT_SHADER, fragmentSource, fragmentPath);
    } catch (const std::runtime_error&) {
        glDeleteShader(vertex);
        throw;
    }

    program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);

    glDeleteShader(vertex);
    glDeleteShader(fragment);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[1024];
        glGetProgramInfoLog(program, sizeof(infoLog), nullptr, infoLog);
        glDeleteProgram(program);
        program = 0;
        throw std::runtime_error("Shader link failed (" + vertexPath + ", " + fragmentPath + "): " + infoLog);
    }
    std::cout << "[Shader] Linked " << vertexPath << " + " << fragmentPath << std::endl;
}

Shader::~Shader() {
    if (program != 0) {
        glDeleteProgram(program);
        program = 0;
    }
}

std::string Shader::readSource(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Failed to open shader source: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

unsigned int Shader::compileStage(unsigned int type, const std::string& source, const std::string& path) {
    unsigned int shader = glCreateShader(type);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[1024];
        glGetShaderInfoLog(shader, sizeof(infoLog), nullptr, infoLog);
        glDeleteShader(shader);
        throw std::runtime_error("Shader compile failed (" + path + "): " + infoLog);
    }
    return shader;
}

void Shader::use() const {
    glUseProgram(program);
}

void Shader::setBool(const std::string& name, bool value) const {
    glUniform1i(glGetUniformLocation(program, name.c_str()), static_cast<int>(value));
}

void Shader::setInt(const std::string& name, int value) const {
    glUniform1i(glGetUniformLocation(program, name.c_str()), value);
}

void Shader::setVec3(const std::string& name, const glm::vec3& value) const {
    glUniform3fv(glGetUniformLocation(program, name.c_str()), 1, glm::value_ptr(value));
}

void Shader::setMat4(const std::string& name, const glm::mat4& value) const {
    glUniformMatrix4fv(glGetUniformLocation(program, name.c_str()), 1, GL_FALSE, glm::value_ptr(value));
}
