#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include "CubeEnvironment.h"
#include "CubeRenderer.h"
#include "MoveNotation.h"
#include "input.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr unsigned int SCR_WIDTH = 1024;
constexpr unsigned int SCR_HEIGHT = 768;

constexpr float kManualTurnDuration = 0.25f;
constexpr float kAgentTurnDuration = 0.15f;
constexpr int kScrambleSteps = 20;
constexpr int kMaxEpisodeSteps = 200;

const char* const kVertexShaderPath = "shaders/cube.vs";
const char* const kFragmentShaderPath = "shaders/cube.fs";
const char* const kStickerTexturePath = "assets/sticker.png";
const char* const kTurnSoundPaths[] = {"assets/turn1.wav", "assets/turn2.wav"};

// Keyboard letter for each face, indexed by face
const std::array<int, kFaceCount> kFaceKeys = {
    GLFW_KEY_U, GLFW_KEY_D, GLFW_KEY_F, GLFW_KEY_B, GLFW_KEY_R, GLFW_KEY_L
};

class CubeViewerApplication {
public:
    CubeViewerApplication();
    ~CubeViewerApplication();

    int run();

private:
    void initWindow();
    void initGLAD();
    void initRenderState();
    void mainLoop();
    void updateDeltaTime();
    void processInput();
    void updateOrbitCamera();
    void renderScene();
    void requestMove(const CubeMove& move, float duration);
    void commitMove(const CubeMove& move);
    void newEpisode(int scrambleSteps);
    void refuseReset();

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
    static void scroll_callback(GLFWwindow* window, double xoffset, double yoffset);

    GLFWwindow* window{nullptr};
    bool glfwInitialized{false};
    int framebufferWidth{static_cast<int>(SCR_WIDTH)};
    int framebufferHeight{static_cast<int>(SCR_HEIGHT)};

    float deltaTime{0.0f};
    float lastFrame{0.0f};

    glm::vec3 cameraPos{0.0f};
    glm::vec3 orbitTarget{0.0f};
    float orbitYaw{45.0f};
    float orbitPitch{30.0f};
    float orbitDistance{9.0f};
    float orbitMinDistance{4.0f};
    float orbitMaxDistance{25.0f};
    float orbitSensitivity{0.25f};
    float orbitZoomSpeed{0.6f};
    float fieldOfView{45.0f};
    std::pair<double, double> lastMouse{0.0, 0.0};

    std::unique_ptr<Input> input;
    std::unique_ptr<CubeRenderer> renderer;
    CubeEnvironment environment;
};

EnvironmentConfig viewerEnvironmentConfig() {
    EnvironmentConfig config;
    config.maxSteps = kMaxEpisodeSteps;
    config.defaultScrambleSteps = kScrambleSteps;
    return config;
}

CubeViewerApplication::CubeViewerApplication()
    : environment(viewerEnvironmentConfig()) {
    environment.reset(0);
    updateOrbitCamera();
}

CubeViewerApplication::~CubeViewerApplication() {
    // GL objects must go before the context
    renderer.reset();
    input.reset();

    if (window) {
        glfwDestroyWindow(window);
        window = nullptr;
    }
    if (glfwInitialized) {
        glfwTerminate();
    }
}

int CubeViewerApplication::run() {
    initWindow();
    initGLAD();
    initRenderState();
    mainLoop();
    return 0;
}

void CubeViewerApplication::initWindow() {
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }
    glfwInitialized = true;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 8);

#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    window = glfwCreateWindow(SCR_WIDTH, SCR_HEIGHT, "Cube Environment", nullptr, nullptr);
    if (window == nullptr) {
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(window, this);
    glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);
    glfwSetScrollCallback(window, scroll_callback);
    glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);

    input = std::make_unique<Input>(window);
}

void CubeViewerApplication::initGLAD() {
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        throw std::runtime_error("Failed to initialize GLAD");
    }
}

void CubeViewerApplication::initRenderState() {
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_MULTISAMPLE);

    renderer = std::make_unique<CubeRenderer>(
        kVertexShaderPath,
        kFragmentShaderPath,
        kStickerTexturePath,
        orbitTarget,
        1.0f);
    renderer->setTurnSounds(std::vector<std::string>(std::begin(kTurnSoundPaths), std::end(kTurnSoundPaths)), 55.0f);

    std::cout << "[Viewer] U D F B R L turn a face clockwise, Shift for counter-clockwise\n"
              << "[Viewer] P new scrambled episode, Backspace reset, Space random action\n"
              << "[Viewer] T toggle sticker texture, middle mouse orbit, scroll zoom, Esc quit" << std::endl;
    environment.cube().printState();
}

void CubeViewerApplication::updateOrbitCamera() {
    orbitPitch = glm::clamp(orbitPitch, -85.0f, 85.0f);
    orbitDistance = glm::clamp(orbitDistance, orbitMinDistance, orbitMaxDistance);
    float yawRad = glm::radians(orbitYaw);
    float pitchRad = glm::radians(orbitPitch);
    glm::vec3 offset;
    offset.x = orbitDistance * std::cos(pitchRad) * std::sin(yawRad);
    offset.y = orbitDistance * std::sin(pitchRad);
    offset.z = orbitDistance * std::cos(pitchRad) * std::cos(yawRad);
    cameraPos = orbitTarget + offset;
}

void CubeViewerApplication::mainLoop() {
    while (!glfwWindowShouldClose(window)) {
        updateDeltaTime();
        input->update();
        processInput();

        // A finished animation is the only point where cube state changes
        if (auto finished = renderer->updateAnimation(deltaTime)) {
            commitMove(*finished);
        }

        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, framebufferWidth, framebufferHeight);
        glClearColor(0.92f, 0.92f, 0.94f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        renderScene();

        glfwSwapBuffers(window);
    }
}

void CubeViewerApplication::updateDeltaTime() {
    float currentFrame = static_cast<float>(glfwGetTime());
    deltaTime = currentFrame - lastFrame;
    lastFrame = currentFrame;
}

void CubeViewerApplication::processInput() {
    if (input->isKeyDown(GLFW_KEY_ESCAPE)) {
        glfwSetWindowShouldClose(window, true);
    }

    // Orbit with the middle mouse button
    auto mouse = input->getMousePos();
    if (input->isMouseButtonHeld(GLFW_MOUSE_BUTTON_MIDDLE) && !input->isMouseButtonDown(GLFW_MOUSE_BUTTON_MIDDLE)) {
        orbitYaw -= static_cast<float>(mouse.first - lastMouse.first) * orbitSensitivity;
        orbitPitch += static_cast<float>(mouse.second - lastMouse.second) * orbitSensitivity;
    }
    lastMouse = mouse;
    orbitDistance -= static_cast<float>(input->takeScroll()) * orbitZoomSpeed;
    updateOrbitCamera();

    if (input->isKeyDown(GLFW_KEY_T)) {
        bool enabled = !renderer->areStickerTexturesEnabled();
        renderer->setStickerTexturesEnabled(enabled);
        std::cout << "[Viewer] Sticker textures " << (enabled ? "enabled" : "disabled") << std::endl;
    }

    for (int face = 0; face < kFaceCount; ++face) {
        if (input->isKeyDown(kFaceKeys[face])) {
            requestMove(CubeMove(face, !input->isShiftHeld()), kManualTurnDuration);
        }
    }

    if (input->isKeyDown(GLFW_KEY_SPACE)) {
        requestMove(CubeEnvironment::decodeAction(environment.sampleAction()), kAgentTurnDuration);
    }

    // Episode resets replace the whole state, so wait for queued turns to land
    if (input->isKeyDown(GLFW_KEY_P)) {
        if (renderer->isAnimating()) {
            refuseReset();
        } else {
            newEpisode(kScrambleSteps);
        }
    }
    if (input->isKeyDown(GLFW_KEY_BACKSPACE)) {
        if (renderer->isAnimating()) {
            refuseReset();
        } else {
            newEpisode(0);
        }
    }
}

void CubeViewerApplication::requestMove(const CubeMove& move, float duration) {
    renderer->queueMove(move, duration);
}

void CubeViewerApplication::commitMove(const CubeMove& move) {
    StepResult result = environment.step(CubeEnvironment::encodeAction(move));

    std::cout << "[Viewer] " << std::setw(2) << MoveNotation::moveToString(move)
              << " step " << environment.stepCount()
              << " reward " << std::fixed << std::setprecision(3) << result.reward
              << (result.terminated ? " terminated" : "") << std::endl;

    if (result.terminated) {
        if (environment.cube().isSolved()) {
            std::cout << "[Viewer] Solved!" << std::endl;
        }
        environment.printSummary();
    }
}

void CubeViewerApplication::newEpisode(int scrambleSteps) {
    environment.reset(scrambleSteps);
    std::cout << "[Viewer] New episode, scramble: "
              << (scrambleSteps > 0 ? MoveNotation::sequenceToString(environment.lastScramble()) : "(none)")
              << std::endl;
    environment.cube().printState();
}

// Drops queued turns so only the active one still has to land
void CubeViewerApplication::refuseReset() {
    size_t dropped = renderer->pendingMoves() - 1;
    renderer->clearQueue();
    std::cout << "[Viewer] Busy, dropped " << dropped << " queued turn(s); retry once the current turn lands" << std::endl;
}

void CubeViewerApplication::renderScene() {
    float aspect = static_cast<float>(framebufferWidth) / static_cast<float>(std::max(framebufferHeight, 1));
    glm::mat4 projection = glm::perspective(glm::radians(fieldOfView), aspect, 0.1f, 100.0f);
    glm::mat4 view = glm::lookAt(cameraPos, orbitTarget, glm::vec3(0.0f, 1.0f, 0.0f));

    // Snapshot once per frame; the renderer only reads it
    const CubeState snapshot = environment.observation();
    renderer->draw(snapshot, projection, view, cameraPos);
}

void CubeViewerApplication::framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    if (auto* app = static_cast<CubeViewerApplication*>(glfwGetWindowUserPointer(window))) {
        app->framebufferWidth = std::max(1, width);
        app->framebufferHeight = std::max(1, height);
    }
}

void CubeViewerApplication::scroll_callback(GLFWwindow* window, double /*xoffset*/, double yoffset) {
    if (auto* app = static_cast<CubeViewerApplication*>(glfwGetWindowUserPointer(window))) {
        if (app->input) {
            app->input->addScroll(yoffset);
        }
    }
}

} // namespace

int main() {
    try {
        CubeViewerApplication app;
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return -1;
    }
}
