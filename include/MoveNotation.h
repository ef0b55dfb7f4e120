#pragma once

#include <string>
#include <vector>

#include "CubeTypes.h"

// Face-letter notation: "F" clockwise, "F'" counter-clockwise, "F2" half turn
namespace MoveNotation {

std::string moveToString(const CubeMove& move);
std::string sequenceToString(const std::vector<CubeMove>& moves);

// Whitespace separated tokens; a half turn expands to two clockwise quarter turns
std::vector<CubeMove> parseMoves(const std::string& text);

std::vector<CubeMove> invertMoves(const std::vector<CubeMove>& moves);

}
