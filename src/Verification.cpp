#include "rubikpow/Verification.h"
#include "rubikpow/PuzzleState.h"

namespace rubikpow {

bool verifySolution(const PuzzleState& reference, const std::vector<Move>& candidate) {
    PuzzleState working = reference.clone();
    working.applyMoves(candidate);
    return working.isSolved();
}

} // namespace rubikpow
