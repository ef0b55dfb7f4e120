#include "FaceletCube.h"

#include <iostream>
#include <sstream>

FaceletCube::FaceletCube() {
    reset();
}

void FaceletCube::reset() {
    for (int f = 0; f < kFaceCount; ++f) {
        for (auto& row : faces[f]) {
            row.fill(f);
        }
    }
}

bool FaceletCube::isSolved() const {
    for (int f = 0; f < kFaceCount; ++f) {
        for (const auto& row : faces[f]) {
            for (int value : row) {
                if (value != f) {
                    return false;
                }
            }
        }
    }
    return true;
}

CubeState FaceletCube::getState() const {
    CubeState state{};
    for (int f = 0; f < kFaceCount; ++f) {
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                state[f * kFaceletsPerFace + r * 3 + c] = faces[f][r][c];
            }
        }
    }
    return state;
}

const FaceGrid& FaceletCube::face(int faceIndex) const {
    checkFace(faceIndex);
    return faces[faceIndex];
}

void FaceletCube::checkFace(int faceIndex) {
    if (!isValidFace(faceIndex)) {
        throw InvalidMove("face index out of range: " + std::to_string(faceIndex));
    }
}

void FaceletCube::rotateFace(int faceIndex, bool clockwise) {
    checkFace(faceIndex);
    const FaceGrid old = faces[faceIndex];
    FaceGrid& grid = faces[faceIndex];

    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            grid[r][c] = clockwise ? old[2 - c][r] : old[c][2 - r];
        }
    }
}

void FaceletCube::propagateAdjacent(int faceIndex, bool clockwise) {
    const FaceStrips& strips = Adjacency::adjacentStrips(faceIndex);

    std::array<std::array<int, 3>, 4> saved{};
    for (int s = 0; s < 4; ++s) {
        for (int k = 0; k < 3; ++k) {
            const auto cell = strips[s].cell(k);
            saved[s][k] = faces[strips[s].face][cell.row][cell.col];
        }
    }

    // Clockwise: strip s takes what strip s-1 held; counter-clockwise takes s+1
    for (int s = 0; s < 4; ++s) {
        const int source = clockwise ? (s + 3) % 4 : (s + 1) % 4;
        for (int k = 0; k < 3; ++k) {
            const auto cell = strips[s].cell(k);
            faces[strips[s].face][cell.row][cell.col] = saved[source][k];
        }
    }
}

void FaceletCube::applyMove(int faceIndex, bool clockwise) {
    checkFace(faceIndex);
    rotateFace(faceIndex, clockwise);
    propagateAdjacent(faceIndex, clockwise);
}

void FaceletCube::applyMoves(const std::vector<CubeMove>& moves) {
    for (const auto& move : moves) {
        applyMove(move);
    }
}

std::vector<CubeMove> FaceletCube::scramble(int count, std::mt19937& rng) {
    if (count < 0) {
        throw InvalidMove("scramble length must be non-negative: " + std::to_string(count));
    }

    std::uniform_int_distribution<int> actionDist(0, kActionCount - 1);
    std::vector<CubeMove> moves;
    moves.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        CubeMove move = actionToMove(actionDist(rng));
        applyMove(move);
        moves.push_back(move);
    }
    return moves;
}

std::vector<CubeMove> FaceletCube::scramble(int count, std::optional<std::uint32_t> seed) {
    std::mt19937 rng(seed ? *seed : std::random_device{}());
    return scramble(count, rng);
}

int FaceletCube::misplacedCount() const {
    int misplaced = 0;
    for (int f = 0; f < kFaceCount; ++f) {
        for (const auto& row : faces[f]) {
            for (int value : row) {
                if (value != f) {
                    ++misplaced;
                }
            }
        }
    }
    return misplaced;
}

std::array<int, kFaceCount> FaceletCube::colorCounts() const {
    std::array<int, kFaceCount> counts{};
    for (const auto& grid : faces) {
        for (const auto& row : grid) {
            for (int value : row) {
                if (value >= 0 && value < kFaceCount) {
                    ++counts[value];
                }
            }
        }
    }
    return counts;
}

std::string FaceletCube::renderText() const {
    // Unfolded net: U above F, then L F R B, then D below F
    std::ostringstream out;
    auto writeRow = [&](int faceIndex, int row) {
        for (int c = 0; c < 3; ++c) {
            out << faceLetter(faces[faceIndex][row][c]) << ' ';
        }
    };

    for (int r = 0; r < 3; ++r) {
        out << "      ";
        writeRow(UP, r);
        out << '\n';
    }
    for (int r = 0; r < 3; ++r) {
        for (int f : {LEFT, FRONT, RIGHT, BACK}) {
            writeRow(f, r);
        }
        out << '\n';
    }
    for (int r = 0; r < 3; ++r) {
        out << "      ";
        writeRow(DOWN, r);
        out << '\n';
    }
    return out.str();
}

void FaceletCube::printState() const {
    std::cout << "\n=== Cube State ===" << std::endl;
    std::cout << renderText();
    std::cout << "Solved: " << (isSolved() ? "YES" : "NO") << std::endl;
    std::cout << "==================\n" << std::endl;
}
