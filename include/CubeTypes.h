#pragma once

#include <array>
#include <stdexcept>
#include <string>

// Face indices double as the solved color of that face
enum Face : int {
    UP = 0,
    DOWN = 1,
    FRONT = 2,
    BACK = 3,
    RIGHT = 4,
    LEFT = 5,
};

constexpr int kFaceCount = 6;
constexpr int kFaceletsPerFace = 9;
constexpr int kFaceletCount = kFaceCount * kFaceletsPerFace;
constexpr int kActionCount = kFaceCount * 2;

// Row 0 is the top of the face as seen from outside the cube
using FaceGrid = std::array<std::array<int, 3>, 3>;

// Flat snapshot: index = face * 9 + row * 3 + col
using CubeState = std::array<int, kFaceletCount>;

struct CubeMove {
    int face{0};
    bool clockwise{true};

    CubeMove() = default;
    CubeMove(int faceIndex, bool cw) : face(faceIndex), clockwise(cw) {}

    CubeMove inverse() const { return CubeMove(face, !clockwise); }

    bool operator==(const CubeMove& other) const {
        return face == other.face && clockwise == other.clockwise;
    }
    bool operator!=(const CubeMove& other) const { return !(*this == other); }
};

// Raised for out-of-range faces, malformed actions and unknown notation
class InvalidMove : public std::out_of_range {
public:
    explicit InvalidMove(const std::string& what) : std::out_of_range(what) {}
};

inline bool isValidFace(int face) {
    return face >= 0 && face < kFaceCount;
}

inline char faceLetter(int face) {
    static constexpr char kLetters[kFaceCount] = {'U', 'D', 'F', 'B', 'R', 'L'};
    return isValidFace(face) ? kLetters[face] : '?';
}

inline const char* faceName(int face) {
    static constexpr const char* kNames[kFaceCount] = {"Up", "Down", "Front", "Back", "Right", "Left"};
    return isValidFace(face) ? kNames[face] : "Invalid";
}

// Action encoding: face * 2 + (clockwise ? 0 : 1), even actions turn clockwise
inline CubeMove actionToMove(int action) {
    if (action < 0 || action >= kActionCount) {
        throw InvalidMove("action index out of range: " + std::to_string(action));
    }
    return CubeMove(action / 2, action % 2 == 0);
}

inline int moveToAction(const CubeMove& move) {
    if (!isValidFace(move.face)) {
        throw InvalidMove("face index out of range: " + std::to_string(move.face));
    }
    return move.face * 2 + (move.clockwise ? 0 : 1);
}
