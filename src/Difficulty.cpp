#include "rubikpow/Difficulty.h"
#include "rubikpow/Constants.h"
#include "rubikpow/Digest.h"
#include "rubikpow/Errors.h"
#include "rubikpow/PuzzleState.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rubikpow {

namespace {
double log2Factorial(int k) {
    return std::lgamma(k + 1.0) / std::log(2.0);
}

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}
} // namespace

// Closed form: corners * middle edges (odd sizes) * 24! per wing and center orbit,
// divided by the interchangeable same-colored centers (4!)^6 per center orbit.
double configurationLog2(int size) {
    if (size < 1) {
        throw SizeError(size, 1);
    }
    if (size == 1) {
        return 0.0;
    }

    const double n = size;
    double base = 0.0;
    double wingOrbits = 0.0;
    double centerOrbits = 0.0;
    if (size % 2 == 0) {
        // No fixed centers: the corner orbit fixes the orientation
        base = log2Factorial(7) + 6.0 * std::log2(3.0);
        wingOrbits = (n - 2.0) / 2.0;
        centerOrbits = (n - 2.0) * (n - 2.0) / 4.0;
    } else {
        base = log2Factorial(8) + 7.0 * std::log2(3.0) + log2Factorial(12) + 10.0;
        wingOrbits = (n - 3.0) / 2.0;
        centerOrbits = (n - 3.0) * (n - 1.0) / 4.0;
    }
    return base + (wingOrbits + centerOrbits) * log2Factorial(24) - 6.0 * centerOrbits * log2Factorial(4);
}

DifficultyFigure describeDifficulty(int size) {
    const double bits = configurationLog2(size);
    switch (size) {
        case 1:
            return DifficultyFigure{1, bits, true};
        case 2:
            // 7! * 3^6
            return DifficultyFigure{static_cast<Uint128>(5040) * 729, bits, true};
        case 3:
            // 8! * 3^7 * 12! * 2^10
            return DifficultyFigure{static_cast<Uint128>(40320) * 2187 * 479001600 * 1024, bits, true};
        default:
            // 4x4x4 already needs ~152 bits
            return DifficultyFigure{MAX_UINT128, bits, false};
    }
}

Uint128 calculateDifficulty(int size) {
    return describeDifficulty(size).value;
}

Uint128 stateHashValue(const PuzzleState& state) {
    const Digest digest = sha3_256(state.canonicalSerialize());
    Uint128 value = 0;
    for (size_t i = 0; i < DIFFICULTY_PREFIX_SIZE; ++i) {
        value = (value << 8) | digest[i];
    }
    return value;
}

bool meetsDifficulty(const PuzzleState& state, Uint128 target) {
    return stateHashValue(state) <= target;
}

Uint128 targetFromDifficulty(Uint128 difficulty) {
    if (difficulty <= 1) {
        return MAX_UINT128;
    }
    return MAX_UINT128 / difficulty;
}

Uint128 targetFromLeadingZeroBits(int bits) {
    if (bits < 0 || bits > 128) {
        throw std::invalid_argument("leading zero bits must be within 0..128, got " + std::to_string(bits));
    }
    if (bits == 128) {
        return 0;
    }
    return MAX_UINT128 >> bits;
}

std::string toDecimalString(Uint128 value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits += static_cast<char>('0' + static_cast<int>(value % 10));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string toHexString(Uint128 value) {
    static const char hexDigits[] = "0123456789abcdef";
    if (value == 0) {
        return "0x0";
    }
    std::string digits;
    while (value > 0) {
        digits += hexDigits[static_cast<int>(value & 0xF)];
        value >>= 4;
    }
    std::reverse(digits.begin(), digits.end());
    return "0x" + digits;
}

Uint128 parseUint128(const std::string& text) {
    const bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    const size_t start = hex ? 2 : 0;
    if (text.size() <= start) {
        throw std::invalid_argument("empty number");
    }

    Uint128 value = 0;
    for (size_t i = start; i < text.size(); ++i) {
        if (hex) {
            const int digit = hexValue(text[i]);
            if (digit < 0) {
                throw std::invalid_argument("invalid hex digit in '" + text + "'");
            }
            if ((value >> 124) != 0) {
                throw std::out_of_range("'" + text + "' does not fit 128 bits");
            }
            value = (value << 4) | static_cast<Uint128>(digit);
        } else {
            if (text[i] < '0' || text[i] > '9') {
                throw std::invalid_argument("invalid decimal digit in '" + text + "'");
            }
            const int digit = text[i] - '0';
            if (value > (MAX_UINT128 - digit) / 10) {
                throw std::out_of_range("'" + text + "' does not fit 128 bits");
            }
            value = value * 10 + digit;
        }
    }
    return value;
}

} // namespace rubikpow
