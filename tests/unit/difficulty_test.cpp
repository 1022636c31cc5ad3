// Configuration counts, state hash values, targets and 128-bit formatting.

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rubikpow/Difficulty.h"
#include "rubikpow/Digest.h"
#include "rubikpow/Errors.h"
#include "rubikpow/PuzzleState.h"

using namespace rubikpow;
using std::cout;

static int passed = 0;
static int failed = 0;

static void check(bool condition, const std::string& what) {
    if (condition) {
        passed++;
    } else {
        failed++;
        cout << "  FAIL: " << what << "\n";
    }
}

static bool near(double a, double b, double tolerance) {
    return std::fabs(a - b) <= tolerance;
}

static void testConfigurationCounts() {
    cout << "\n=== Test: Configuration counts ===\n";
    check(calculateDifficulty(1) == 1, "1x1x1 has a single state");
    check(calculateDifficulty(2) == 3674160, "2x2x2 count");
    check(calculateDifficulty(3) == makeUint128(2, 6358515127070752768ULL), "3x3x3 count");
    check(toDecimalString(calculateDifficulty(3)) == "43252003274489856000", "3x3x3 decimal");

    for (int n = 1; n <= 3; ++n) {
        check(describeDifficulty(n).exact, "exact for size " + std::to_string(n));
    }
    for (int n = 4; n <= 10; ++n) {
        const DifficultyFigure figure = describeDifficulty(n);
        check(!figure.exact, "saturated for size " + std::to_string(n));
        check(figure.value == MAX_UINT128, "ceiling value for size " + std::to_string(n));
    }

    bool threw = false;
    try {
        calculateDifficulty(0);
    } catch (const SizeError& e) {
        threw = e.getSize() == 0;
    }
    check(threw, "size 0 rejected");
}

static void testConfigurationLog2() {
    cout << "\n=== Test: log2 of configuration counts ===\n";
    check(configurationLog2(1) == 0.0, "size 1");
    check(near(configurationLog2(2), std::log2(3674160.0), 1e-9), "size 2 matches exact count");
    check(near(configurationLog2(3), 65.2290, 1e-3), "size 3");
    check(near(configurationLog2(4), 152.3745, 1e-3), "size 4");
    check(near(configurationLog2(5), 247.3228, 1e-3), "size 5");

    bool increasing = true;
    for (int n = 2; n < 16; ++n) {
        increasing = increasing && configurationLog2(n + 1) > configurationLog2(n);
    }
    check(increasing, "strictly increasing with size");
    check(describeDifficulty(7).log2Configurations == configurationLog2(7), "figure carries log2");
}

static void testStateHash() {
    cout << "\n=== Test: State hash value ===\n";
    check(stateHashValue(PuzzleState(2)) == makeUint128(17823249779084013132ULL, 13825691825182089936ULL), "solved 2x2x2");
    check(stateHashValue(PuzzleState(3)) == makeUint128(3746816311270716152ULL, 10986287883092056794ULL), "solved 3x3x3");
    check(stateHashValue(PuzzleState(4)) == makeUint128(5035734061645715137ULL, 13196854124762774930ULL), "solved 4x4x4");

    PuzzleState turned(3);
    turned.applyMove(Move(R));
    check(stateHashValue(turned) != stateHashValue(PuzzleState(3)), "turn changes the hash");

    // Rotations keep the cube solved but move the colors, so the hash changes too
    PuzzleState rotated(3);
    rotated.applyMove(Move(Y));
    check(rotated.isSolved() && stateHashValue(rotated) != stateHashValue(PuzzleState(3)), "rotation changes the hash");
}

static void testTargets() {
    cout << "\n=== Test: Target comparison ===\n";
    const PuzzleState solved(3);
    const Uint128 value = stateHashValue(solved);

    check(meetsDifficulty(solved, MAX_UINT128), "max target always met");
    check(meetsDifficulty(solved, value), "equal to target is met");
    check(!meetsDifficulty(solved, value - 1), "one below fails");
    check(!meetsDifficulty(solved, 0), "zero target fails");

    // 0x33ff... has two leading zero bits
    check(meetsDifficulty(solved, targetFromLeadingZeroBits(2)), "two zero bits met");
    check(!meetsDifficulty(solved, targetFromLeadingZeroBits(3)), "three zero bits missed");

    check(targetFromLeadingZeroBits(0) == MAX_UINT128, "zero bits is max");
    check(targetFromLeadingZeroBits(64) == makeUint128(0, 0xFFFFFFFFFFFFFFFFULL), "64 bits");
    check(targetFromLeadingZeroBits(128) == 0, "128 bits is zero");
    bool threwLow = false;
    bool threwHigh = false;
    try {
        targetFromLeadingZeroBits(-1);
    } catch (const std::invalid_argument&) {
        threwLow = true;
    }
    try {
        targetFromLeadingZeroBits(129);
    } catch (const std::invalid_argument&) {
        threwHigh = true;
    }
    check(threwLow && threwHigh, "bit counts outside 0..128 rejected");

    check(targetFromDifficulty(0) == MAX_UINT128, "difficulty 0");
    check(targetFromDifficulty(1) == MAX_UINT128, "difficulty 1");
    check(targetFromDifficulty(2) == (MAX_UINT128 >> 1), "difficulty 2");
    check(targetFromDifficulty(calculateDifficulty(3)) == 7867435983517505380ULL, "difficulty of 3x3x3 count");
}

static void testFormatting() {
    cout << "\n=== Test: 128-bit formatting and parsing ===\n";
    check(toDecimalString(0) == "0", "decimal zero");
    check(toDecimalString(MAX_UINT128) == "340282366920938463463374607431768211455", "decimal max");
    check(toHexString(0) == "0x0", "hex zero");
    check(toHexString(255) == "0xff", "hex ff");
    check(toHexString(MAX_UINT128) == "0xffffffffffffffffffffffffffffffff", "hex max");

    check(parseUint128("0") == 0, "parse zero");
    check(parseUint128("43252003274489856000") == calculateDifficulty(3), "parse decimal");
    check(parseUint128("0xFF") == 255, "parse upper hex");
    check(parseUint128("340282366920938463463374607431768211455") == MAX_UINT128, "parse decimal max");
    check(parseUint128("0xffffffffffffffffffffffffffffffff") == MAX_UINT128, "parse hex max");

    const std::vector<std::string> invalid = {"", "0x", "12a", "-1", "0xg1", " 1"};
    for (const auto& text : invalid) {
        bool threw = false;
        try {
            parseUint128(text);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "rejects '" + text + "'");
    }

    const std::vector<std::string> overflow = {"340282366920938463463374607431768211456",
                                               "0x1ffffffffffffffffffffffffffffffff"};
    for (const auto& text : overflow) {
        bool threw = false;
        try {
            parseUint128(text);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        check(threw, "overflow '" + text + "'");
    }
}

static void testDigest() {
    cout << "\n=== Test: SHA3-256 ===\n";
    check(digestToHex(sha3_256(std::vector<uint8_t>())) ==
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a",
          "empty input");
    check(digestToHex(sha3_256(std::vector<uint8_t>{'a', 'b', 'c'})) ==
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532",
          "abc");
    const uint8_t raw[] = {'a', 'b', 'c'};
    check(sha3_256(raw, sizeof(raw)) == sha3_256(std::vector<uint8_t>{'a', 'b', 'c'}), "pointer overload");
}

int main() {
    testConfigurationCounts();
    testConfigurationLog2();
    testStateHash();
    testTargets();
    testFormatting();
    testDigest();

    cout << "\nSummary: " << passed << " passed, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}
