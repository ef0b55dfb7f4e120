#include "CubeRenderer.h"

#include <algorithm>
#include <iostream>

#include <glad/glad.h>
#include <glm/gtc/matrix_transform.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "AdjacencyTable.h"

namespace {
// Outward normal, direction of increasing column and of increasing row,
// matching how each face grid is read from outside the cube
struct FaceFrame {
    glm::vec3 normal;
    glm::vec3 colDir;
    glm::vec3 rowDir;
};

const std::array<FaceFrame, kFaceCount> kFaceFrames = {{
    {{0, 1, 0},  {1, 0, 0},  {0, 0, 1}},   // Up
    {{0, -1, 0}, {1, 0, 0},  {0, 0, -1}},  // Down
    {{0, 0, 1},  {1, 0, 0},  {0, -1, 0}},  // Front
    {{0, 0, -1}, {-1, 0, 0}, {0, -1, 0}},  // Back
    {{1, 0, 0},  {0, 0, -1}, {0, -1, 0}},  // Right
    {{-1, 0, 0}, {0, 0, 1},  {0, -1, 0}},  // Left
}};

const std::array<glm::vec3, kFaceCount> kStickerColors = {
    glm::vec3(1.0f, 1.0f, 1.0f),   // Up: white
    glm::vec3(1.0f, 0.85f, 0.0f),  // Down: yellow
    glm::vec3(0.0f, 0.7f, 0.2f),   // Front: green
    glm::vec3(0.0f, 0.25f, 0.9f),  // Back: blue
    glm::vec3(0.85f, 0.05f, 0.05f),// Right: red
    glm::vec3(1.0f, 0.5f, 0.0f),   // Left: orange
};

const glm::vec3 kBodyColor{0.05f, 0.05f, 0.06f};
const glm::vec3 kLightDirection{-0.4f, -1.0f, -0.6f};

constexpr float kCubieFill = 0.96f;
constexpr float kStickerFill = 0.84f;

// position(3) normal(3) uv(2)
constexpr float kCubeVertices[] = {
    // back
    -0.5f, -0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 0.0f, 0.0f,
     0.5f,  0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 1.0f, 1.0f,
     0.5f, -0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 1.0f, 0.0f,
     0.5f,  0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 1.0f, 1.0f,
    -0.5f, -0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 0.0f, 0.0f,
    -0.5f,  0.5f, -0.5f,  0.0f,  0.0f, -1.0f, 0.0f, 1.0f,
    // front
    -0.5f, -0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 0.0f, 0.0f,
     0.5f, -0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 1.0f, 0.0f,
     0.5f,  0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 1.0f, 1.0f,
     0.5f,  0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 1.0f, 1.0f,
    -0.5f,  0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 0.0f, 1.0f,
    -0.5f, -0.5f,  0.5f,  0.0f,  0.0f,  1.0f, 0.0f, 0.0f,
    // left
    -0.5f,  0.5f,  0.5f, -1.0f,  0.0f,  0.0f, 1.0f, 0.0f,
    -0.5f,  0.5f, -0.5f, -1.0f,  0.0f,  0.0f, 1.0f, 1.0f,
    -0.5f, -0.5f, -0.5f, -1.0f,  0.0f,  0.0f, 0.0f, 1.0f,
    -0.5f, -0.5f, -0.5f, -1.0f,  0.0f,  0.0f, 0.0f, 1.0f,
    -0.5f, -0.5f,  0.5f, -1.0f,  0.0f,  0.0f, 0.0f, 0.0f,
    -0.5f,  0.5f,  0.5f, -1.0f,  0.0f,  0.0f, 1.0f, 0.0f,
    // right
     0.5f,  0.5f,  0.5f,  1.0f,  0.0f,  0.0f, 1.0f, 0.0f,
     0.5f, -0.5f, -0.5f,  1.0f,  0.0f,  0.0f, 0.0f, 1.0f,
     0.5f,  0.5f, -0.5f,  1.0f,  0.0f,  0.0f, 1.0f, 1.0f,
     0.5f, -0.5f, -0.5f,  1.0f,  0.0f,  0.0f, 0.0f, 1.0f,
     0.5f,  0.5f,  0.5f,  1.0f,  0.0f,  0.0f, 1.0f, 0.0f,
     0.5f, -0.5f,  0.5f,  1.0f,  0.0f,  0.0f, 0.0f, 0.0f,
    // bottom
    -0.5f, -0.5f, -0.5f,  0.0f, -1.0f,  0.0f, 0.0f, 1.0f,
     0.5f, -0.5f, -0.5f,  0.0f, -1.0f,  0.0f, 1.0f, 1.0f,
     0.5f, -0.5f,  0.5f,  0.0f, -1.0f,  0.0f, 1.0f, 0.0f,
     0.5f, -0.5f,  0.5f,  0.0f, -1.0f,  0.0f, 1.0f, 0.0f,
    -0.5f, -0.5f,  0.5f,  0.0f, -1.0f,  0.0f, 0.0f, 0.0f,
    -0.5f, -0.5f, -0.5f,  0.0f, -1.0f,  0.0f, 0.0f, 1.0f,
    // top
    -0.5f,  0.5f, -0.5f,  0.0f,  1.0f,  0.0f, 0.0f, 1.0f,
     0.5f,  0.5f,  0.5f,  0.0f,  1.0f,  0.0f, 1.0f, 0.0f,
     0.5f,  0.5f, -0.5f,  0.0f,  1.0f,  0.0f, 1.0f, 1.0f,
     0.5f,  0.5f,  0.5f,  0.0f,  1.0f,  0.0f, 1.0f, 0.0f,
    -0.5f,  0.5f, -0.5f,  0.0f,  1.0f,  0.0f, 0.0f, 1.0f,
    -0.5f,  0.5f,  0.5f,  0.0f,  1.0f,  0.0f, 0.0f, 0.0f,
};

// Unit quad in the XY plane facing +Z
constexpr float kStickerVertices[] = {
    -0.5f, -0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  0.0f, 0.0f,
     0.5f, -0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  1.0f, 0.0f,
     0.5f,  0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  1.0f, 1.0f,
     0.5f,  0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  1.0f, 1.0f,
    -0.5f,  0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  0.0f, 1.0f,
    -0.5f, -0.5f, 0.0f,  0.0f, 0.0f, 1.0f,  0.0f, 0.0f,
};

void uploadMesh(unsigned int& vao, unsigned int& vbo, const float* data, size_t bytes) {
    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes), data, GL_STATIC_DRAW);

    const GLsizei stride = 8 * sizeof(float);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(0));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(3 * sizeof(float)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 2, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(6 * sizeof(float)));
    glBindVertexArray(0);
}
} // namespace

CubeRenderer::CubeRenderer(const std::string& vertexShaderPath,
                           const std::string& fragmentShaderPath,
                           const std::string& stickerTexturePath,
                           const glm::vec3& cubeCenter,
                           float cubieSpacingValue)
    : shader(vertexShaderPath, fragmentShaderPath),
      center(cubeCenter),
      cubieSpacing(cubieSpacingValue) {
    buildGeometry();
    buildLayerMasks();
    if (!stickerTexturePath.empty()) {
        loadStickerTextures(stickerTexturePath);
    }
}

CubeRenderer::~CubeRenderer() {
    releaseGL();
}

void CubeRenderer::buildGeometry() {
    uploadMesh(cubieVAO, cubieVBO, kCubeVertices, sizeof(kCubeVertices));
    uploadMesh(stickerVAO, stickerVBO, kStickerVertices, sizeof(kStickerVertices));

    cubies.clear();
    cubies.reserve(26);
    for (int x = -1; x <= 1; ++x) {
        for (int y = -1; y <= 1; ++y) {
            for (int z = -1; z <= 1; ++z) {
                if (x == 0 && y == 0 && z == 0) {
                    continue;
                }
                cubies.emplace_back(x, y, z);
            }
        }
    }
}

void CubeRenderer::buildLayerMasks() {
    // A turning layer is the face itself plus the four strips it drags along
    for (int f = 0; f < kFaceCount; ++f) {
        auto& mask = inLayer[f];
        mask.fill(false);
        for (int i = 0; i < kFaceletsPerFace; ++i) {
            mask[f * kFaceletsPerFace + i] = true;
        }
        for (const auto& strip : Adjacency::adjacentStrips(f)) {
            for (int k = 0; k < 3; ++k) {
                const auto cell = strip.cell(k);
                mask[strip.face * kFaceletsPerFace + cell.row * 3 + cell.col] = true;
            }
        }
    }
}

void CubeRenderer::loadStickerTextures(const std::string& texturePath) {
    int width = 0;
    int height = 0;
    int channels = 0;

    stbi_set_flip_vertically_on_load(false);
    unsigned char* img = stbi_load(texturePath.c_str(), &width, &height, &channels, 0);
    if (!img) {
        std::cerr << "[Renderer] Failed to load sticker texture: " << texturePath << std::endl;
        return;
    }

    const int pixelCount = width * height;
    GLenum format = (channels == 4) ? GL_RGBA : GL_RGB;
    const int stride = (format == GL_RGBA) ? 4 : 3;

    std::vector<unsigned char> tinted(static_cast<size_t>(pixelCount) * stride, 255);
    glGenTextures(static_cast<GLsizei>(stickerTextures.size()), stickerTextures.data());

    // One tinted copy of the grey tile per sticker color
    for (int color = 0; color < kFaceCount; ++color) {
        for (int i = 0; i < pixelCount; ++i) {
            int srcIdx = i * channels;
            int dstIdx = i * stride;

            unsigned char r = img[srcIdx];
            unsigned char g = (channels >= 2) ? img[srcIdx + 1] : img[srcIdx];
            unsigned char b = (channels >= 3) ? img[srcIdx + 2] : img[srcIdx];

            float brightness = std::min(1.0f, std::max({r, g, b}) / 255.0f * 1.2f);
            glm::vec3 rgb = glm::clamp(kStickerColors[color] * brightness, 0.0f, 1.0f);

            tinted[dstIdx] = static_cast<unsigned char>(rgb.r * 255.0f);
            tinted[dstIdx + 1] = static_cast<unsigned char>(rgb.g * 255.0f);
            tinted[dstIdx + 2] = static_cast<unsigned char>(rgb.b * 255.0f);
            if (format == GL_RGBA) {
                tinted[dstIdx + 3] = img[srcIdx + 3];
            }
        }

        glBindTexture(GL_TEXTURE_2D, stickerTextures[color]);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR_MIPMAP_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        // Tightly packed rows
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(format), width, height, 0, format, GL_UNSIGNED_BYTE, tinted.data());
        glGenerateMipmap(GL_TEXTURE_2D);
    }
    glBindTexture(GL_TEXTURE_2D, 0);

    stbi_image_free(img);
    stickerTexturesAvailable = true;
    std::cout << "[Renderer] Sticker texture " << texturePath << " (" << width << "x" << height << ")" << std::endl;
}

void CubeRenderer::releaseGL() {
    if (stickerTexturesAvailable) {
        glDeleteTextures(static_cast<GLsizei>(stickerTextures.size()), stickerTextures.data());
        stickerTexturesAvailable = false;
    }
    if (stickerVBO != 0) { glDeleteBuffers(1, &stickerVBO); stickerVBO = 0; }
    if (stickerVAO != 0) { glDeleteVertexArrays(1, &stickerVAO); stickerVAO = 0; }
    if (cubieVBO != 0) { glDeleteBuffers(1, &cubieVBO); cubieVBO = 0; }
    if (cubieVAO != 0) { glDeleteVertexArrays(1, &cubieVAO); cubieVAO = 0; }
}

glm::mat4 CubeRenderer::layerRotation(bool inTurningLayer) const {
    if (!animating || !inTurningLayer) {
        return glm::mat4(1.0f);
    }
    return glm::rotate(glm::mat4(1.0f), glm::radians(currentAngle), kFaceFrames[activeMove.face].normal);
}

glm::mat4 CubeRenderer::stickerMatrix(int face, int row, int col) const {
    const FaceFrame& frame = kFaceFrames[face];
    glm::vec3 cubie = frame.normal
                    + static_cast<float>(col - 1) * frame.colDir
                    + static_cast<float>(row - 1) * frame.rowDir;
    glm::vec3 position = cubie * cubieSpacing + frame.normal * (0.5f * kCubieFill * cubieSpacing + 0.002f);

    // Quad X follows the columns, quad Y points to row 0, quad Z faces outward
    const float size = kStickerFill * cubieSpacing;
    glm::mat4 local(glm::vec4(frame.colDir * size, 0.0f),
                    glm::vec4(-frame.rowDir * size, 0.0f),
                    glm::vec4(frame.normal, 0.0f),
                    glm::vec4(position, 1.0f));
    return local;
}

glm::mat4 CubeRenderer::cubieMatrix(const glm::ivec3& cubie) const {
    glm::mat4 local = glm::translate(glm::mat4(1.0f), glm::vec3(cubie) * cubieSpacing);
    return glm::scale(local, glm::vec3(kCubieFill * cubieSpacing));
}

void CubeRenderer::draw(const CubeState& snapshot,
                        const glm::mat4& projection,
                        const glm::mat4& view,
                        const glm::vec3& cameraPos) {
    const glm::mat4 toWorld = glm::translate(glm::mat4(1.0f), center);

    shader.use();
    shader.setMat4("projection", projection);
    shader.setMat4("view", view);
    shader.setVec3("viewPos", cameraPos);
    shader.setVec3("lightDir", kLightDirection);

    // Bodies
    shader.setBool("useTexture", false);
    shader.setVec3("baseColor", kBodyColor);
    glBindVertexArray(cubieVAO);
    for (const auto& cubie : cubies) {
        bool moving = animating && glm::dot(glm::vec3(cubie), kFaceFrames[activeMove.face].normal) > 0.5f;
        shader.setMat4("model", toWorld * layerRotation(moving) * cubieMatrix(cubie));
        glDrawArrays(GL_TRIANGLES, 0, 36);
    }

    // Stickers
    const bool textured = areStickerTexturesEnabled();
    shader.setBool("useTexture", textured);
    shader.setInt("stickerTexture", 0);
    glActiveTexture(GL_TEXTURE0);
    glBindVertexArray(stickerVAO);
    for (int f = 0; f < kFaceCount; ++f) {
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                const int index = f * kFaceletsPerFace + r * 3 + c;
                const int color = snapshot[index];
                if (color < 0 || color >= kFaceCount) {
                    continue;
                }
                bool moving = animating && inLayer[activeMove.face][index];
                shader.setMat4("model", toWorld * layerRotation(moving) * stickerMatrix(f, r, c));
                shader.setVec3("baseColor", kStickerColors[color]);
                if (textured) {
                    glBindTexture(GL_TEXTURE_2D, stickerTextures[color]);
                }
                glDrawArrays(GL_TRIANGLES, 0, 6);
            }
        }
    }
    glBindVertexArray(0);
}

void CubeRenderer::queueMove(const CubeMove& move, float duration) {
    if (!isValidFace(move.face)) {
        throw InvalidMove("face index out of range: " + std::to_string(move.face));
    }
    moveQueue.push({move, duration});

    // Start immediately if idle
    if (!animating) {
        QueuedMove next = moveQueue.front();
        moveQueue.pop();
        startMove(next);
    }
}

void CubeRenderer::clearQueue() {
    std::queue<QueuedMove>().swap(moveQueue);
}

void CubeRenderer::startMove(const QueuedMove& queued) {
    animating = true;
    activeMove = queued.move;
    // Outward normals with the right-hand rule: clockwise seen from outside is negative
    targetAngle = queued.move.clockwise ? -90.0f : 90.0f;
    currentAngle = 0.0f;
    animationDuration = std::max(queued.duration, 0.01f);
    animationTime = 0.0f;

    turnSounds.play(animationDuration);
}

std::optional<CubeMove> CubeRenderer::updateAnimation(float deltaTime) {
    if (!animating) {
        if (!moveQueue.empty()) {
            QueuedMove next = moveQueue.front();
            moveQueue.pop();
            startMove(next);
        }
        return std::nullopt;
    }

    animationTime += deltaTime;

    // Ease-out cubic for smoother finish
    float t = std::min(animationTime / animationDuration, 1.0f);
    float easedT = 1.0f - (1.0f - t) * (1.0f - t) * (1.0f - t);
    currentAngle = targetAngle * easedT;

    if (t < 1.0f) {
        return std::nullopt;
    }

    CubeMove finished = activeMove;
    animating = false;
    targetAngle = 0.0f;
    currentAngle = 0.0f;
    animationTime = 0.0f;

    // Chain the next queued move if present
    if (!moveQueue.empty()) {
        QueuedMove next = moveQueue.front();
        moveQueue.pop();
        startMove(next);
    }
    return finished;
}

void CubeRenderer::setTurnSounds(const std::vector<std::string>& soundPaths, float volume) {
    size_t loaded = turnSounds.load(soundPaths, volume);
    std::cout << "[Renderer] Turn sounds: " << loaded << "/" << soundPaths.size() << " loaded" << std::endl;
}
