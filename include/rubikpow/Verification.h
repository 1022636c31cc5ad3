#pragma once

#include <vector>

#include "Move.h"

namespace rubikpow {

class PuzzleState;

// Replays candidate on a copy of reference; true iff the copy ends solved.
// The reference state is never modified.
bool verifySolution(const PuzzleState& reference, const std::vector<Move>& candidate);

} // namespace rubikpow
