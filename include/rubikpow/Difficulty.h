#pragma once

#include <cstdint>
#include <string>

namespace rubikpow {

class PuzzleState;

__extension__ typedef unsigned __int128 Uint128;

constexpr Uint128 MAX_UINT128 = ~static_cast<Uint128>(0);

inline Uint128 makeUint128(uint64_t high, uint64_t low) {
    return (static_cast<Uint128>(high) << 64) | low;
}

struct DifficultyFigure {
    // Configuration count; saturated at MAX_UINT128 when not exact
    Uint128 value;
    // log2 of the configuration count from the closed-form formula
    double log2Configurations;
    // False above 3x3x3: the count does not fit 128 bits, value is a ceiling only
    bool exact;
};

// Throws SizeError for size < 1
DifficultyFigure describeDifficulty(int size);
Uint128 calculateDifficulty(int size);
double configurationLog2(int size);

// First DIFFICULTY_PREFIX_SIZE bytes of SHA3-256(canonical serialization), big-endian
Uint128 stateHashValue(const PuzzleState& state);

// Hash-below-target check on whatever state is given, solved or not
bool meetsDifficulty(const PuzzleState& state, Uint128 target);

// MAX_UINT128 / difficulty; 0 and 1 both map to MAX_UINT128
Uint128 targetFromDifficulty(Uint128 difficulty);

// Largest value with at least bits leading zero bits; bits in 0..128
Uint128 targetFromLeadingZeroBits(int bits);

std::string toDecimalString(Uint128 value);
std::string toHexString(Uint128 value);

// Decimal, or hexadecimal with a 0x prefix. Throws std::invalid_argument / std::out_of_range.
Uint128 parseUint128(const std::string& text);

} // namespace rubikpow
