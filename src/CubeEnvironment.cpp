#include "CubeEnvironment.h"

#include <iostream>

#include "MoveNotation.h"

CubeEnvironment::CubeEnvironment(const EnvironmentConfig& config)
    : cfg(config),
      rng(config.seed ? *config.seed : std::random_device{}()) {
    if (cfg.maxSteps <= 0) {
        throw std::invalid_argument("maxSteps must be positive");
    }
}

CubeState CubeEnvironment::reset() {
    return reset(cfg.defaultScrambleSteps);
}

CubeState CubeEnvironment::reset(int scrambleSteps) {
    return beginEpisode(scrambleSteps);
}

CubeState CubeEnvironment::reset(int scrambleSteps, std::uint32_t seed) {
    rng.seed(seed);
    return beginEpisode(scrambleSteps);
}

CubeState CubeEnvironment::beginEpisode(int scrambleSteps) {
    if (scrambleSteps < 0) {
        throw InvalidMove("scramble length must be non-negative: " + std::to_string(scrambleSteps));
    }
    engine.reset();
    scrambleMoves = engine.scramble(scrambleSteps, rng);
    steps = 0;
    done = false;
    return engine.getState();
}

StepResult CubeEnvironment::step(int action) {
    // Decode before mutating so a bad action leaves the episode untouched
    const CubeMove move = decodeAction(action);

    engine.applyMove(move);
    ++steps;

    const bool solved = engine.isSolved();
    StepResult result;
    result.state = engine.getState();
    result.reward = rewardFor(solved);
    // A finished episode keeps reporting terminated until the next reset
    result.terminated = done || solved || steps >= cfg.maxSteps;
    result.truncated = false;

    done = result.terminated;
    return result;
}

int CubeEnvironment::sampleAction() {
    std::uniform_int_distribution<int> actionDist(0, kActionCount - 1);
    return actionDist(rng);
}

double CubeEnvironment::rewardFor(bool solved) const {
    if (solved) {
        return cfg.solveReward;
    }
    return -static_cast<double>(engine.misplacedCount()) / static_cast<double>(kFaceletCount);
}

void CubeEnvironment::printSummary() const {
    std::cout << "[Environment] steps=" << steps << "/" << cfg.maxSteps
              << " solved=" << (engine.isSolved() ? "YES" : "NO")
              << " misplaced=" << engine.misplacedCount()
              << " scramble=\"" << MoveNotation::sequenceToString(scrambleMoves) << "\""
              << std::endl;
}
