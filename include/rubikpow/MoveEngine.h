#pragma once

#include <array>
#include <vector>

#include "CubeTypes.h"
#include "Move.h"

namespace rubikpow {

class PuzzleState;

// One line of facelets on a neighbor face, taken parallel to the shared edge.
// At layer depth d the line is row d (top), row n-1-d (bottom), column d (left)
// or column n-1-d (right); reversed lines are walked from the far end.
struct EdgeStrip {
    Face face;
    Edge edge;
    bool reversed;
};

// For each face, the four neighbor strips in the order a clockwise quarter turn
// carries facelets: strip k moves onto strip k + 1 (mod 4), cell i onto cell i.
extern const std::array<std::array<EdgeStrip, 4>, 6> kFaceAdjacency;

class MoveEngine {
public:
    static void apply(PuzzleState& state, const Move& move);

    // Quarter-turns layers firstDepth..lastDepth (inclusive, counted inward from face)
    // clockwise as seen from face. Depths are clamped to the cube; an empty range is a no-op.
    static void turnLayers(PuzzleState& state, Face face, int firstDepth, int lastDepth, int quarterTurns);

    // Deepest layer a wide move turns: 1 on cubes larger than 3x3x3, otherwise 0.
    static int wideDepth(int size);

    // In-place clockwise rotation of a row-major n x n grid
    static void rotateGridCW(std::vector<Color>& grid, int n);

private:
    static void cycleLayer(PuzzleState& state, Face face, int depth);
    static int stripCell(const EdgeStrip& strip, int n, int depth, int i);
};

} // namespace rubikpow
