#include "rubikpow/MoveEngine.h"
#include "rubikpow/PuzzleState.h"

#include <algorithm>

namespace rubikpow {

const std::array<std::array<EdgeStrip, 4>, 6> kFaceAdjacency = {{
    // Up: the top rows circulate F -> L -> B -> R
    {{{FRONT, EDGE_TOP, false}, {LEFT, EDGE_TOP, false}, {BACK, EDGE_TOP, false}, {RIGHT, EDGE_TOP, false}}},
    // Down
    {{{FRONT, EDGE_BOTTOM, false}, {RIGHT, EDGE_BOTTOM, false}, {BACK, EDGE_BOTTOM, false}, {LEFT, EDGE_BOTTOM, false}}},
    // Left
    {{{UP, EDGE_LEFT, false}, {FRONT, EDGE_LEFT, false}, {DOWN, EDGE_LEFT, false}, {BACK, EDGE_RIGHT, true}}},
    // Right
    {{{UP, EDGE_RIGHT, false}, {BACK, EDGE_LEFT, true}, {DOWN, EDGE_RIGHT, false}, {FRONT, EDGE_RIGHT, false}}},
    // Front
    {{{UP, EDGE_BOTTOM, false}, {RIGHT, EDGE_LEFT, false}, {DOWN, EDGE_TOP, true}, {LEFT, EDGE_RIGHT, true}}},
    // Back
    {{{UP, EDGE_TOP, false}, {LEFT, EDGE_LEFT, true}, {DOWN, EDGE_BOTTOM, true}, {RIGHT, EDGE_RIGHT, false}}},
}};

void MoveEngine::apply(PuzzleState& state, const Move& move) {
    if (move.isIdentity()) {
        return;
    }
    const int n = state.getSize();
    int lastDepth = 0;
    if (move.isWide()) {
        lastDepth = wideDepth(n);
    } else if (move.isRotation()) {
        lastDepth = n - 1;
    }
    turnLayers(state, move.getFace(), 0, lastDepth, move.getAmount());
}

void MoveEngine::turnLayers(PuzzleState& state, Face face, int firstDepth, int lastDepth, int quarterTurns) {
    const int n = state.getSize();
    firstDepth = std::max(firstDepth, 0);
    lastDepth = std::min(lastDepth, n - 1);
    const int turns = ((quarterTurns % 4) + 4) % 4;
    if (firstDepth > lastDepth || turns == 0) {
        return;
    }

    for (int t = 0; t < turns; ++t) {
        if (firstDepth == 0) {
            rotateGridCW(state.grid(face), n);
        }
        // The far face turns the other way as seen from outside
        if (lastDepth == n - 1) {
            std::vector<Color>& far = state.grid(oppositeFace(face));
            for (int k = 0; k < 3; ++k) {
                rotateGridCW(far, n);
            }
        }
        for (int depth = firstDepth; depth <= lastDepth; ++depth) {
            cycleLayer(state, face, depth);
        }
    }
}

int MoveEngine::wideDepth(int size) {
    return size > 3 ? 1 : 0;
}

void MoveEngine::rotateGridCW(std::vector<Color>& grid, int n) {
    auto cell = [&grid, n](int row, int col) -> Color& { return grid[row * n + col]; };
    for (int i = 0; i < n / 2; ++i) {
        for (int j = i; j < n - i - 1; ++j) {
            Color temp = cell(i, j);
            cell(i, j) = cell(n - j - 1, i);
            cell(n - j - 1, i) = cell(n - i - 1, n - j - 1);
            cell(n - i - 1, n - j - 1) = cell(j, n - i - 1);
            cell(j, n - i - 1) = temp;
        }
    }
}

void MoveEngine::cycleLayer(PuzzleState& state, Face face, int depth) {
    const int n = state.getSize();
    const auto& strips = kFaceAdjacency[face];

    std::vector<Color> carry(n);
    std::vector<Color>& last = state.grid(strips[3].face);
    for (int i = 0; i < n; ++i) {
        carry[i] = last[stripCell(strips[3], n, depth, i)];
    }
    for (int k = 3; k > 0; --k) {
        std::vector<Color>& dst = state.grid(strips[k].face);
        const std::vector<Color>& src = state.grid(strips[k - 1].face);
        for (int i = 0; i < n; ++i) {
            dst[stripCell(strips[k], n, depth, i)] = src[stripCell(strips[k - 1], n, depth, i)];
        }
    }
    std::vector<Color>& first = state.grid(strips[0].face);
    for (int i = 0; i < n; ++i) {
        first[stripCell(strips[0], n, depth, i)] = carry[i];
    }
}

int MoveEngine::stripCell(const EdgeStrip& strip, int n, int depth, int i) {
    const int k = strip.reversed ? n - 1 - i : i;
    switch (strip.edge) {
        case EDGE_TOP:    return depth * n + k;
        case EDGE_BOTTOM: return (n - 1 - depth) * n + k;
        case EDGE_LEFT:   return k * n + depth;
        case EDGE_RIGHT:  return k * n + (n - 1 - depth);
    }
    return 0;
}

} // namespace rubikpow
