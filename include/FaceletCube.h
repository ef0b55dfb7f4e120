#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "AdjacencyTable.h"
#include "CubeTypes.h"

// Sticker-level 3x3x3 cube. Face f is solved when all nine facelets equal f.
class FaceletCube {
public:
    FaceletCube();

    void reset();
    bool isSolved() const;

    // Flat (face, row, col) snapshot
    CubeState getState() const;
    const FaceGrid& face(int faceIndex) const;

    // Step one of a move: turns only the face's own grid. Leaves the cube
    // geometrically invalid until propagateAdjacent runs for the same move.
    void rotateFace(int faceIndex, bool clockwise);
    // Step two of a move: cycles the four bordering strips by one position
    void propagateAdjacent(int faceIndex, bool clockwise);

    void applyMove(int faceIndex, bool clockwise);
    void applyMove(const CubeMove& move) { applyMove(move.face, move.clockwise); }
    void applyMoves(const std::vector<CubeMove>& moves);

    std::vector<CubeMove> scramble(int count, std::mt19937& rng);
    std::vector<CubeMove> scramble(int count, std::optional<std::uint32_t> seed = std::nullopt);

    int misplacedCount() const;
    std::array<int, kFaceCount> colorCounts() const;

    std::string renderText() const;
    void printState() const;

    bool operator==(const FaceletCube& other) const { return faces == other.faces; }
    bool operator!=(const FaceletCube& other) const { return !(*this == other); }

private:
    static void checkFace(int faceIndex);

    std::array<FaceGrid, kFaceCount> faces;
};
