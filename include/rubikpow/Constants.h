#pragma once

#include <cstddef>
#include <cstdint>

namespace rubikpow {

// Puzzle geometry
constexpr int MIN_PUZZLE_SIZE = 2;
constexpr int NUM_FACES = 6;
constexpr int NUM_COLORS = 6;

// Largest edge length accepted when decoding a serialized state
constexpr int MAX_DECODED_SIZE = 4096;

// Deterministic scramble length range (inclusive)
constexpr int SCRAMBLE_MIN_LENGTH = 20;
constexpr int SCRAMBLE_MAX_LENGTH = 30;

// Digest output size in bytes (SHA3-256)
constexpr size_t DIGEST_SIZE = 32;

// Number of digest bytes interpreted as the difficulty hash value
constexpr size_t DIFFICULTY_PREFIX_SIZE = 16;

// Default bounds for block submissions
constexpr int DEFAULT_MIN_SUBMISSION_SIZE = 2;
constexpr int DEFAULT_MAX_SUBMISSION_SIZE = 16;
constexpr size_t DEFAULT_MAX_SOLUTION_MOVES = 4096;

} // namespace rubikpow
