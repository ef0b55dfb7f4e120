#include "MoveNotation.h"

#include <sstream>

namespace MoveNotation {
namespace {
int faceFromLetter(char letter) {
    switch (letter) {
        case 'U': return UP;
        case 'D': return DOWN;
        case 'F': return FRONT;
        case 'B': return BACK;
        case 'R': return RIGHT;
        case 'L': return LEFT;
        default:  return -1;
    }
}
} // namespace

std::string moveToString(const CubeMove& move) {
    if (!isValidFace(move.face)) {
        throw InvalidMove("face index out of range: " + std::to_string(move.face));
    }
    std::string s(1, faceLetter(move.face));
    if (!move.clockwise) {
        s += '\'';
    }
    return s;
}

std::string sequenceToString(const std::vector<CubeMove>& moves) {
    std::string s;
    for (const auto& move : moves) {
        if (!s.empty()) s += ' ';
        s += moveToString(move);
    }
    return s;
}

std::vector<CubeMove> parseMoves(const std::string& text) {
    std::vector<CubeMove> moves;
    std::istringstream iss(text);
    std::string tok;
    while (iss >> tok) {
        int face = faceFromLetter(tok[0]);
        if (face < 0 || tok.size() > 2) {
            throw InvalidMove("unknown move token: " + tok);
        }

        if (tok.size() == 1) {
            moves.emplace_back(face, true);
        } else if (tok[1] == '\'') {
            moves.emplace_back(face, false);
        } else if (tok[1] == '2') {
            moves.emplace_back(face, true);
            moves.emplace_back(face, true);
        } else {
            throw InvalidMove("unknown move token: " + tok);
        }
    }
    return moves;
}

std::vector<CubeMove> invertMoves(const std::vector<CubeMove>& moves) {
    std::vector<CubeMove> out;
    out.reserve(moves.size());
    for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
        out.push_back(it->inverse());
    }
    return out;
}

} // namespace MoveNotation
