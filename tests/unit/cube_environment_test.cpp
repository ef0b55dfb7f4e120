// CubeEnvironment episode checks: action codec, rewards, termination, seeding.

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "CubeEnvironment.h"
#include "MoveNotation.h"

using std::cout;

namespace {
bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

EnvironmentConfig seededConfig(std::uint32_t seed, int maxSteps = 100) {
    EnvironmentConfig config;
    config.seed = seed;
    config.maxSteps = maxSteps;
    return config;
}
}

void testActionCodec() {
    cout << "\n=== Test: Action Codec ===\n";
    assert(CubeEnvironment::actionCount() == 12);
    assert(CubeEnvironment::observationSize() == 54);

    CubeMove four = CubeEnvironment::decodeAction(4);
    assert(four.face == FRONT && four.clockwise);
    CubeMove five = CubeEnvironment::decodeAction(5);
    assert(five.face == FRONT && !five.clockwise);

    for (int action = 0; action < kActionCount; ++action) {
        CubeMove move = CubeEnvironment::decodeAction(action);
        assert(move.face == action / 2);
        assert(move.clockwise == (action % 2 == 0));
        assert(CubeEnvironment::encodeAction(move) == action);
    }

    for (int bad : {-1, 12}) {
        bool threw = false;
        try {
            CubeEnvironment::decodeAction(bad);
        } catch (const InvalidMove&) {
            threw = true;
        }
        assert(threw);
    }
    cout << "PASSED: Action codec\n";
}

void testResetObservation() {
    cout << "\n=== Test: Reset Observation ===\n";
    CubeEnvironment env(seededConfig(3));

    CubeState solved = env.reset(0);
    assert(env.cube().isSolved());
    assert(env.lastScramble().empty());
    assert(env.stepCount() == 0);
    assert(!env.isDone());
    for (int i = 0; i < kFaceletCount; ++i) {
        assert(solved[i] == i / kFaceletsPerFace);
    }

    // Default scramble length comes from the config
    env.reset();
    assert(static_cast<int>(env.lastScramble().size()) == env.config().defaultScrambleSteps);
    assert(env.observation() == env.cube().getState());

    bool threw = false;
    try {
        env.reset(-5);
    } catch (const InvalidMove&) {
        threw = true;
    }
    assert(threw);
    cout << "PASSED: Reset observation\n";
}

// The reported scramble is exactly what was applied
void testScrambleReplay() {
    cout << "\n=== Test: Scramble Replay ===\n";
    CubeEnvironment env(seededConfig(17));
    for (int round = 0; round < 5; ++round) {
        CubeState obs = env.reset(15);
        FaceletCube replay;
        replay.applyMoves(env.lastScramble());
        assert(replay.getState() == obs);
    }
    cout << "PASSED: Scramble replay\n";
}

void testSeededResetReproducible() {
    cout << "\n=== Test: Seeded Reset Reproducible ===\n";
    CubeEnvironment a;
    CubeEnvironment b;
    CubeState obsA = a.reset(20, 77u);
    CubeState obsB = b.reset(20, 77u);
    assert(obsA == obsB);
    assert(a.lastScramble() == b.lastScramble());

    // Same stream afterwards
    for (int i = 0; i < 10; ++i) {
        assert(a.sampleAction() == b.sampleAction());
    }

    // Config seed behaves the same way
    CubeEnvironment c(seededConfig(123));
    CubeEnvironment d(seededConfig(123));
    assert(c.reset() == d.reset());
    cout << "PASSED: Seeded reset reproducible\n";
}

void testStepReward() {
    cout << "\n=== Test: Step Reward ===\n";
    CubeEnvironment env(seededConfig(1));
    env.reset(0);

    StepResult first = env.step(CubeEnvironment::encodeAction(CubeMove(FRONT, true)));
    assert(env.stepCount() == 1);
    assert(!first.terminated);
    assert(!first.truncated);
    assert(first.state == env.observation());
    assert(nearlyEqual(first.reward, -12.0 / 54.0));

    StepResult second = env.step(CubeEnvironment::encodeAction(CubeMove(FRONT, false)));
    assert(env.cube().isSolved());
    assert(nearlyEqual(second.reward, 10.0));
    assert(second.terminated);
    assert(!second.truncated);
    assert(env.isDone());
    cout << "PASSED: Step reward\n";
}

// Unsolved rewards stay in [-1, 0)
void testRewardRange() {
    cout << "\n=== Test: Reward Range ===\n";
    CubeEnvironment env(seededConfig(8, 1000));
    env.reset(25);
    for (int i = 0; i < 200; ++i) {
        StepResult result = env.step(env.sampleAction());
        if (env.cube().isSolved()) {
            assert(nearlyEqual(result.reward, env.config().solveReward));
        } else {
            assert(result.reward < 0.0 && result.reward >= -1.0);
            assert(nearlyEqual(result.reward, -env.cube().misplacedCount() / 54.0));
        }
    }
    cout << "PASSED: Reward range\n";
}

void testSolveRewardConfigurable() {
    cout << "\n=== Test: Solve Reward Configurable ===\n";
    EnvironmentConfig config = seededConfig(5);
    config.solveReward = 2.5;
    CubeEnvironment env(config);
    env.reset(0);
    env.step(CubeEnvironment::encodeAction(CubeMove(UP, true)));
    StepResult result = env.step(CubeEnvironment::encodeAction(CubeMove(UP, false)));
    assert(nearlyEqual(result.reward, 2.5));
    cout << "PASSED: Solve reward configurable\n";
}

void testStepLimit() {
    cout << "\n=== Test: Step Limit ===\n";
    CubeEnvironment env(seededConfig(2, 3));
    env.reset(0);

    // R R R leaves the cube unsolved until the limit
    StepResult r1 = env.step(CubeEnvironment::encodeAction(CubeMove(RIGHT, true)));
    StepResult r2 = env.step(CubeEnvironment::encodeAction(CubeMove(RIGHT, true)));
    assert(!r1.terminated && !r2.terminated);
    StepResult r3 = env.step(CubeEnvironment::encodeAction(CubeMove(RIGHT, true)));
    assert(r3.terminated);
    assert(!r3.truncated);
    assert(!env.cube().isSolved());

    // Stepping a finished episode still applies the move and stays terminated
    StepResult r4 = env.step(CubeEnvironment::encodeAction(CubeMove(RIGHT, true)));
    assert(env.cube().isSolved());
    assert(r4.terminated);
    assert(env.stepCount() == 4);

    env.reset(0);
    assert(env.stepCount() == 0);
    assert(!env.isDone());
    cout << "PASSED: Step limit\n";
}

void testInvalidActionLeavesEpisode() {
    cout << "\n=== Test: Invalid Action ===\n";
    CubeEnvironment env(seededConfig(9));
    CubeState before = env.reset(10);
    for (int bad : {-1, 12, 100}) {
        bool threw = false;
        try {
            env.step(bad);
        } catch (const InvalidMove& e) {
            threw = true;
            cout << "  step(" << bad << ") -> " << e.what() << "\n";
        }
        assert(threw);
        assert(env.observation() == before);
        assert(env.stepCount() == 0);
    }
    cout << "PASSED: Invalid action\n";
}

void testSampleActionRange() {
    cout << "\n=== Test: Sample Action Range ===\n";
    CubeEnvironment env(seededConfig(4));
    int seen[kActionCount] = {};
    for (int i = 0; i < 1200; ++i) {
        int action = env.sampleAction();
        assert(action >= 0 && action < kActionCount);
        ++seen[action];
    }
    for (int count : seen) {
        assert(count > 0);
    }
    cout << "PASSED: Sample action range\n";
}

void testInvalidConfig() {
    cout << "\n=== Test: Invalid Config ===\n";
    EnvironmentConfig config;
    config.maxSteps = 0;
    bool threw = false;
    try {
        CubeEnvironment env(config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    cout << "PASSED: Invalid config\n";
}

void testMoveNotation() {
    cout << "\n=== Test: Move Notation ===\n";
    auto moves = MoveNotation::parseMoves("R U R' U'");
    assert(moves.size() == 4);
    assert(moves[0] == CubeMove(RIGHT, true));
    assert(moves[2] == CubeMove(RIGHT, false));
    assert(MoveNotation::sequenceToString(moves) == "R U R' U'");
    assert(MoveNotation::moveToString(CubeMove(LEFT, false)) == "L'");

    auto half = MoveNotation::parseMoves("  F2\tD ");
    assert(half.size() == 3);
    assert(half[0] == CubeMove(FRONT, true) && half[1] == CubeMove(FRONT, true));
    assert(half[2] == CubeMove(DOWN, true));

    assert(MoveNotation::parseMoves("").empty());

    auto inverse = MoveNotation::invertMoves(moves);
    assert(MoveNotation::sequenceToString(inverse) == "U R U' R'");

    for (const char* bad : {"X", "R3", "U''", "f", "R2'"}) {
        bool threw = false;
        try {
            MoveNotation::parseMoves(bad);
        } catch (const InvalidMove&) {
            threw = true;
        }
        assert(threw);
    }
    cout << "PASSED: Move notation\n";
}

int main() {
    cout << "CubeEnvironment Tests\n";
    cout << "=====================\n";

    testActionCodec();
    testResetObservation();
    testScrambleReplay();
    testSeededResetReproducible();
    testStepReward();
    testRewardRange();
    testSolveRewardConfigurable();
    testStepLimit();
    testInvalidActionLeavesEpisode();
    testSampleActionRange();
    testInvalidConfig();
    testMoveNotation();

    cout << "\nAll CubeEnvironment tests passed.\n";
    return 0;
}
