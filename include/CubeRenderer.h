#pragma once

#include <array>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "CubeTypes.h"
#include "Shader.h"
#include "TurnSounds.h"

// Queued move for animation
struct QueuedMove {
    CubeMove move;
    float duration;
};

// Draws a read-only facelet snapshot and animates layer turns. It never
// changes cube state: a finished animation is handed back to the caller,
// which commits it through the environment.
class CubeRenderer {
public:
    CubeRenderer(const std::string& vertexShaderPath,
                 const std::string& fragmentShaderPath,
                 const std::string& stickerTexturePath,
                 const glm::vec3& cubeCenter,
                 float cubieSpacing);
    ~CubeRenderer();

    CubeRenderer(const CubeRenderer&) = delete;
    CubeRenderer& operator=(const CubeRenderer&) = delete;

    void draw(const CubeState& snapshot,
              const glm::mat4& projection,
              const glm::mat4& view,
              const glm::vec3& cameraPos);

    void queueMove(const CubeMove& move, float duration = 0.3f);
    void clearQueue();
    // Advances the active turn; returns the move once its animation finishes
    std::optional<CubeMove> updateAnimation(float deltaTime);
    bool isAnimating() const { return animating || !moveQueue.empty(); }
    size_t pendingMoves() const { return moveQueue.size() + (animating ? 1 : 0); }

    void setStickerTexturesEnabled(bool enabled) { stickerTexturesEnabled = enabled; }
    bool areStickerTexturesEnabled() const { return stickerTexturesAvailable && stickerTexturesEnabled; }
    void setTurnSounds(const std::vector<std::string>& soundPaths, float volume = 70.0f);

private:
    void buildGeometry();
    void buildLayerMasks();
    void loadStickerTextures(const std::string& texturePath);
    void releaseGL();
    void startMove(const QueuedMove& queued);

    glm::mat4 stickerMatrix(int face, int row, int col) const;
    glm::mat4 cubieMatrix(const glm::ivec3& cubie) const;
    glm::mat4 layerRotation(bool inLayer) const;

    Shader shader;
    glm::vec3 center;
    float cubieSpacing;

    unsigned int cubieVAO{0};
    unsigned int cubieVBO{0};
    unsigned int stickerVAO{0};
    unsigned int stickerVBO{0};

    std::array<unsigned int, kFaceCount> stickerTextures{};
    bool stickerTexturesAvailable{false};
    bool stickerTexturesEnabled{true};

    // inLayer[face][facelet]: facelet moves when that face turns
    std::array<std::array<bool, kFaceletCount>, kFaceCount> inLayer{};
    std::vector<glm::ivec3> cubies;

    TurnSounds turnSounds;

    // Animation state
    bool animating{false};
    CubeMove activeMove;
    float targetAngle{0.0f};
    float currentAngle{0.0f};
    float animationDuration{0.3f};
    float animationTime{0.0f};
    std::queue<QueuedMove> moveQueue;
};
