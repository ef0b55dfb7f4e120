#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "CubeTypes.h"
#include "FaceletCube.h"

struct EnvironmentConfig {
    int maxSteps{100};
    int defaultScrambleSteps{20};
    double solveReward{10.0};
    std::optional<std::uint32_t> seed;
};

struct StepResult {
    CubeState state;
    double reward{0.0};
    bool terminated{false};
    bool truncated{false};
};

// Episode wrapper for learning agents: 12 discrete actions, 54-value observation
class CubeEnvironment {
public:
    explicit CubeEnvironment(const EnvironmentConfig& config = EnvironmentConfig{});

    CubeState reset();
    CubeState reset(int scrambleSteps);
    CubeState reset(int scrambleSteps, std::uint32_t seed);

    // Throws InvalidMove for an action outside [0, 11] without touching the episode
    StepResult step(int action);

    int sampleAction();

    static CubeMove decodeAction(int action) { return actionToMove(action); }
    static int encodeAction(const CubeMove& move) { return moveToAction(move); }
    static constexpr int actionCount() { return kActionCount; }
    static constexpr int observationSize() { return kFaceletCount; }

    const FaceletCube& cube() const { return engine; }
    CubeState observation() const { return engine.getState(); }
    int stepCount() const { return steps; }
    bool isDone() const { return done; }
    const std::vector<CubeMove>& lastScramble() const { return scrambleMoves; }
    const EnvironmentConfig& config() const { return cfg; }

    void printSummary() const;

private:
    CubeState beginEpisode(int scrambleSteps);
    double rewardFor(bool solved) const;

    EnvironmentConfig cfg;
    FaceletCube engine;
    std::mt19937 rng;
    std::vector<CubeMove> scrambleMoves;
    int steps{0};
    bool done{false};
};
