#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <vector>

#include "CubeTypes.h"
#include "Move.h"

namespace rubikpow {

// Facelet grid of an n x n x n cube. Each face is stored row-major, size * size entries,
// oriented as in the standard unfolded net (see FaceletGeometry.h for the 3D placement).
class PuzzleState {
public:
    using FaceGrid = std::vector<Color>;

    // Solved cube; throws SizeError when size < MIN_PUZZLE_SIZE.
    explicit PuzzleState(int size);

    // Rebuilds a state from canonicalSerialize() output; throws DecodeError.
    static PuzzleState fromCanonical(const std::vector<uint8_t>& bytes);

    int getSize() const { return size; }
    Color at(Face face, int row, int col) const { return facelets[face][row * size + col]; }
    const FaceGrid& getFace(Face face) const { return facelets[face]; }

    void applyMove(const Move& move);
    void applyMoves(const std::vector<Move>& moves);

    // Every face monochrome
    bool isSolved() const;

    PuzzleState clone() const { return *this; }

    // size (u32 LE), then per face: face tag byte + row-major color bytes
    std::vector<uint8_t> canonicalSerialize() const;

    // Facelets per color, size * size each for any reachable state
    std::array<int, 6> colorCounts() const;

    void print(std::ostream& os) const;
    void printState() const;

    bool operator==(const PuzzleState& other) const;
    bool operator!=(const PuzzleState& other) const { return !(*this == other); }

private:
    friend class MoveEngine;
    friend class FaceletGeometry;

    PuzzleState(int size, std::array<FaceGrid, 6> grids);

    FaceGrid& grid(Face face) { return facelets[face]; }

    int size;
    std::array<FaceGrid, 6> facelets;
};

std::ostream& operator<<(std::ostream& os, const PuzzleState& state);

} // namespace rubikpow
