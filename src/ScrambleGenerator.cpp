#include "rubikpow/ScrambleGenerator.h"
#include "rubikpow/Constants.h"
#include "rubikpow/PuzzleState.h"

#include <stdexcept>

namespace rubikpow {

ScrambleRng::ScrambleRng(const Digest& seedDigest) {
    uint64_t seed = 0;
    for (int i = 7; i >= 0; --i) {
        seed = (seed << 8) | seedDigest[i];
    }
    engine.seed(seed);
}

uint64_t ScrambleRng::below(uint64_t bound) {
    if (bound == 0) {
        throw std::invalid_argument("ScrambleRng::below needs a positive bound");
    }
    // 2^64 mod bound; raw values under it would bias the low residues
    const uint64_t threshold = (0 - bound) % bound;
    while (true) {
        const uint64_t raw = engine();
        if (raw >= threshold) {
            return raw % bound;
        }
    }
}

Digest ScrambleGenerator::seedDigest(uint64_t nonce, const std::vector<uint8_t>& header) {
    std::vector<uint8_t> input;
    input.reserve(8 + header.size());
    for (int i = 0; i < 8; ++i) {
        input.push_back(static_cast<uint8_t>((nonce >> (8 * i)) & 0xFF));
    }
    input.insert(input.end(), header.begin(), header.end());
    return sha3_256(input);
}

std::vector<Move> ScrambleGenerator::drawScramble(uint64_t nonce, const std::vector<uint8_t>& header, PuzzleState* target) {
    ScrambleRng rng(seedDigest(nonce, header));

    const uint64_t span = SCRAMBLE_MAX_LENGTH - SCRAMBLE_MIN_LENGTH + 1;
    const int length = SCRAMBLE_MIN_LENGTH + static_cast<int>(rng.below(span));

    std::vector<Move> moves;
    moves.reserve(length);
    int previous = -1;
    for (int step = 0; step < length; ++step) {
        // Never the same face twice in a row, so neighbors cannot cancel
        int face = static_cast<int>(rng.below(NUM_FACES));
        while (face == previous) {
            face = static_cast<int>(rng.below(NUM_FACES));
        }
        const int amount = 1 + static_cast<int>(rng.below(3));
        const Move move(static_cast<Turn>(face), amount);
        if (target) {
            target->applyMove(move);
        }
        moves.push_back(move);
        previous = face;
    }
    return moves;
}

std::vector<Move> ScrambleGenerator::deriveScramble(uint64_t nonce, const std::vector<uint8_t>& header) {
    return drawScramble(nonce, header, nullptr);
}

std::vector<Move> ScrambleGenerator::scrambleDeterministic(PuzzleState& state, uint64_t nonce, const std::vector<uint8_t>& header) {
    return drawScramble(nonce, header, &state);
}

std::vector<Move> ScrambleGenerator::scrambleDeterministic(PuzzleState& state, uint64_t nonce, const std::string& header) {
    return scrambleDeterministic(state, nonce, std::vector<uint8_t>(header.begin(), header.end()));
}

std::vector<Move> ScrambleGenerator::scrambleRandom(PuzzleState& state, int count, std::mt19937& rng) {
    std::uniform_int_distribution<int> faceDist(0, NUM_FACES - 1);
    std::uniform_int_distribution<int> amountDist(1, 3);

    std::vector<Move> moves;
    moves.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        Move move(static_cast<Turn>(faceDist(rng)), amountDist(rng));
        state.applyMove(move);
        moves.push_back(move);
    }
    return moves;
}

} // namespace rubikpow
