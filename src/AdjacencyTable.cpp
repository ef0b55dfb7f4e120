#include "AdjacencyTable.h"

#include <string>

namespace Adjacency {
namespace {
constexpr StripAxis ROW = StripAxis::Row;
constexpr StripAxis COL = StripAxis::Column;

// Face grids are read from outside the cube:
//   U: row 0 borders B, col 0 borders L      D: row 0 borders F, col 0 borders L
//   F: row 0 borders U, col 0 borders L      B: row 0 borders U, col 0 borders R
//   R: row 0 borders U, col 0 borders F      L: row 0 borders U, col 0 borders B
const std::array<FaceStrips, kFaceCount> kAdjacency = {{
    // Up
    FaceStrips{{{BACK, ROW, 0, true}, {RIGHT, ROW, 0, true}, {FRONT, ROW, 0, true}, {LEFT, ROW, 0, true}}},
    // Down
    FaceStrips{{{FRONT, ROW, 2, false}, {RIGHT, ROW, 2, false}, {BACK, ROW, 2, false}, {LEFT, ROW, 2, false}}},
    // Front
    FaceStrips{{{UP, ROW, 2, false}, {RIGHT, COL, 0, false}, {DOWN, ROW, 0, true}, {LEFT, COL, 2, true}}},
    // Back
    FaceStrips{{{UP, ROW, 0, true}, {LEFT, COL, 0, false}, {DOWN, ROW, 2, false}, {RIGHT, COL, 2, true}}},
    // Right
    FaceStrips{{{UP, COL, 2, true}, {BACK, COL, 0, false}, {DOWN, COL, 2, true}, {FRONT, COL, 2, true}}},
    // Left
    FaceStrips{{{UP, COL, 0, false}, {FRONT, COL, 0, false}, {DOWN, COL, 0, false}, {BACK, COL, 2, true}}},
}};
} // namespace

const FaceStrips& adjacentStrips(int face) {
    if (!isValidFace(face)) {
        throw InvalidMove("face index out of range: " + std::to_string(face));
    }
    return kAdjacency[face];
}

} // namespace Adjacency
