#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "Digest.h"
#include "Move.h"

namespace rubikpow {

class PuzzleState;

// Bounded draws from mt19937_64. Rejection sampling keeps every draw unbiased and
// the sequence identical on any platform (std distributions are implementation-defined).
class ScrambleRng {
public:
    explicit ScrambleRng(uint64_t seed) : engine(seed) {}
    explicit ScrambleRng(const Digest& seedDigest);

    // Uniform in [0, bound); bound must be positive
    uint64_t below(uint64_t bound);

private:
    std::mt19937_64 engine;
};

class ScrambleGenerator {
public:
    // SHA3-256(nonce little-endian || header)
    static Digest seedDigest(uint64_t nonce, const std::vector<uint8_t>& header);

    // Move sequence for (nonce, header) without touching any state
    static std::vector<Move> deriveScramble(uint64_t nonce, const std::vector<uint8_t>& header);

    // Derives the scramble and applies it to state move by move
    static std::vector<Move> scrambleDeterministic(PuzzleState& state, uint64_t nonce, const std::vector<uint8_t>& header);
    static std::vector<Move> scrambleDeterministic(PuzzleState& state, uint64_t nonce, const std::string& header);

    // Non-reproducible scramble of count face turns; not for consensus use
    static std::vector<Move> scrambleRandom(PuzzleState& state, int count, std::mt19937& rng);

private:
    // Applies each move to target (when given) as soon as it is drawn
    static std::vector<Move> drawScramble(uint64_t nonce, const std::vector<uint8_t>& header, PuzzleState* target);
};

} // namespace rubikpow
