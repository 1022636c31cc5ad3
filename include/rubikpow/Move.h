#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "CubeTypes.h"

namespace rubikpow {

// Turn vocabulary: outer face turns, wide turns, whole-cube rotations.
// Values are the wire tags.
enum Turn : int {
    U, D, L, R, F, B,        // Outer face
    UW, DW, LW, RW, FW, BW,  // Wide (outer two layers)
    X, Y, Z,                 // Whole cube, following R, U and F
    TURN_COUNT
};

// A turn plus a clockwise quarter-turn count, always stored as 0..3.
class Move {
public:
    Move() = default;
    Move(Turn turn, int quarterTurns = 1);

    Turn getTurn() const { return turn; }
    int getAmount() const { return amount; }

    // Face whose clockwise sense defines this move
    Face getFace() const;

    bool isFaceTurn() const { return turn <= B; }
    bool isWide() const { return turn >= UW && turn <= BW; }
    bool isRotation() const { return turn >= X && turn < TURN_COUNT; }
    bool isIdentity() const { return amount == 0; }

    Move inverse() const;

    bool operator==(const Move& other) const { return turn == other.turn && amount == other.amount; }
    bool operator!=(const Move& other) const { return !(*this == other); }

private:
    Turn turn{U};
    uint8_t amount{0};
};

std::string moveToString(const Move& move);
Move parseMove(const std::string& token);

// Whitespace-separated notation, e.g. "R U2 Rw' x"
std::vector<Move> parseMoveSequence(const std::string& text);
std::string sequenceToString(const std::vector<Move>& moves);

// Reversed order with every move inverted; undoes the input sequence.
std::vector<Move> invertSequence(const std::vector<Move>& moves);

// Wire form: one (tag, multiplicity) byte pair per move, no normalization on decode.
std::vector<uint8_t> encodeMoves(const std::vector<Move>& moves);
std::vector<Move> decodeMoves(const std::vector<uint8_t>& bytes);

std::ostream& operator<<(std::ostream& os, const Move& move);

} // namespace rubikpow
