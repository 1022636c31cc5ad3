// Move values, text notation and wire encoding.

#include <iostream>
#include <string>
#include <vector>

#include "rubikpow/Errors.h"
#include "rubikpow/Move.h"

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

static void testNormalization() {
    cout << "\n=== Test: Multiplicity normalization ===\n";
    check(Move(U, 4).getAmount() == 0, "4 -> 0");
    check(Move(U, 5) == Move(U, 1), "5 -> 1");
    check(Move(R, -1) == Move(R, 3), "-1 -> 3");
    check(Move(F, -6) == Move(F, 2), "-6 -> 2");
    check(Move().isIdentity() && Move().getTurn() == U, "default is U0");
    check(Move(B, 2) != Move(D, 2), "different turns differ");
}

static void testInverse() {
    cout << "\n=== Test: Inverses ===\n";
    check(Move(U, 1).inverse() == Move(U, 3), "U -> U'");
    check(Move(RW, 2).inverse() == Move(RW, 2), "Rw2 self-inverse");
    check(Move(X, 0).inverse() == Move(X, 0), "identity self-inverse");

    const auto seq = parseMoveSequence("R U2 F' Lw x");
    check(sequenceToString(invertSequence(seq)) == "x' Lw' F U2 R'", "sequence inverse reversed and inverted");
    check(invertSequence(invertSequence(seq)) == seq, "double inversion");
    check(invertSequence({}).empty(), "empty inverse");
}

static void testClassification() {
    cout << "\n=== Test: Move classes ===\n";
    check(Move(L, 1).isFaceTurn() && !Move(L, 1).isWide() && !Move(L, 1).isRotation(), "L is a face turn");
    check(Move(BW, 1).isWide() && !Move(BW, 1).isFaceTurn(), "Bw is wide");
    check(Move(Z, 1).isRotation() && !Move(Z, 1).isWide(), "z is a rotation");
    check(Move(X, 1).getFace() == RIGHT, "x follows R");
    check(Move(Y, 1).getFace() == UP, "y follows U");
    check(Move(Z, 1).getFace() == FRONT, "z follows F");
    check(Move(DW, 1).getFace() == DOWN, "Dw follows D");
}

static void testParsing() {
    cout << "\n=== Test: Parsing ===\n";
    check(parseMove("R") == Move(R, 1), "R");
    check(parseMove("R'") == Move(R, 3), "R'");
    check(parseMove("R2") == Move(R, 2), "R2");
    check(parseMove("R2'") == Move(R, 2), "R2'");
    check(parseMove("R3") == Move(R, 3), "R3");
    check(parseMove("R0") == Move(R, 0), "R0");
    check(parseMove("Uw'") == Move(UW, 3), "Uw'");
    check(parseMove("x2") == Move(X, 2), "x2");
    check(parseMove("Y'") == Move(Y, 3), "Y'");

    for (const char* bad : {"", "Q", "R4", "Rww", "xw", "R''", "r"}) {
        bool threw = false;
        try {
            parseMove(bad);
        } catch (const MoveParseError& e) {
            threw = e.getToken() == bad;
        }
        check(threw, std::string("rejects '") + bad + "'");
    }

    const auto seq = parseMoveSequence("  R  U2\tF'\n Bw2 z ");
    check(seq.size() == 5, "whitespace separated sequence");
    check(parseMoveSequence("").empty(), "empty sequence");
}

static void testFormatting() {
    cout << "\n=== Test: Formatting ===\n";
    check(moveToString(Move(F, 1)) == "F", "F");
    check(moveToString(Move(F, 3)) == "F'", "F'");
    check(moveToString(Move(F, 0)) == "F0", "F0");
    check(moveToString(Move(LW, 2)) == "Lw2", "Lw2");
    check(moveToString(Move(Y, 1)) == "y", "y");

    for (int t = 0; t < TURN_COUNT; ++t) {
        for (int k = 0; k < 4; ++k) {
            const Move move(static_cast<Turn>(t), k);
            check(parseMove(moveToString(move)) == move, "notation round-trip " + moveToString(move));
        }
    }
}

static void testWireEncoding() {
    cout << "\n=== Test: Wire encoding ===\n";
    const std::vector<Move> moves = {Move(R, 2), Move(X, 3), Move(UW, 0)};
    const std::vector<uint8_t> expected = {3, 2, 12, 3, 6, 0};
    check(encodeMoves(moves) == expected, "tag/multiplicity pairs");
    check(decodeMoves(expected) == moves, "decode");
    check(encodeMoves({}).empty() && decodeMoves({}).empty(), "empty list");

    auto rejects = [](const std::vector<uint8_t>& bytes) {
        try {
            decodeMoves(bytes);
        } catch (const DecodeError&) {
            return true;
        }
        return false;
    };
    check(rejects({3}), "odd length");
    check(rejects({15, 1}), "unknown tag");
    check(rejects({0, 4}), "multiplicity 4 not normalized");
    check(rejects({0, 1, 2, 200}), "bad second move");
}

int main() {
    testNormalization();
    testInverse();
    testClassification();
    testParsing();
    testFormatting();
    testWireEncoding();

    cout << "\nSummary: " << passed << " passed, " << failed << " failed\n";
    return failed == 0 ? 0 : 1;
}
