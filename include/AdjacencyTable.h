#pragma once

#include <array>

#include "CubeTypes.h"

enum class StripAxis : int {
    Row,     // fixed row, column varies
    Column,  // fixed column, row varies
};

// One 3-facelet strip on a neighbouring face bordering a rotated face.
// Cells are visited in increasing index along the varying axis unless reversed,
// which makes every strip read in the same clockwise sense around its face.
struct StripDescriptor {
    int face;
    StripAxis axis;
    int index;
    bool reversed;

    struct Cell {
        int row;
        int col;
    };

    Cell cell(int k) const {
        const int along = reversed ? 2 - k : k;
        return axis == StripAxis::Row ? Cell{index, along} : Cell{along, index};
    }
};

using FaceStrips = std::array<StripDescriptor, 4>;

namespace Adjacency {

// Four strips per face, clockwise as seen from outside: top, right, bottom, left edge.
// A clockwise turn moves strip i into strip i + 1.
const FaceStrips& adjacentStrips(int face);

}
