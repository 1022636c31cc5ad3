#include "rubikpow/Move.h"
#include "rubikpow/Errors.h"

#include <sstream>

namespace rubikpow {

namespace {
constexpr const char* kTurnNames[TURN_COUNT] = {
    "U", "D", "L", "R", "F", "B",
    "Uw", "Dw", "Lw", "Rw", "Fw", "Bw",
    "x", "y", "z"
};

int normalizeQuarterTurns(int quarterTurns) {
    return ((quarterTurns % 4) + 4) % 4;
}

bool lookupTurn(const std::string& base, Turn& turn) {
    for (int i = 0; i < TURN_COUNT; ++i) {
        if (base == kTurnNames[i]) {
            turn = static_cast<Turn>(i);
            return true;
        }
    }
    // Uppercase rotations are common in scripts
    if (base == "X") { turn = X; return true; }
    if (base == "Y") { turn = Y; return true; }
    if (base == "Z") { turn = Z; return true; }
    return false;
}
} // namespace

Move::Move(Turn turn, int quarterTurns)
    : turn(turn), amount(static_cast<uint8_t>(normalizeQuarterTurns(quarterTurns))) {}

Face Move::getFace() const {
    switch (turn) {
        case U: case UW: case Y: return UP;
        case D: case DW:         return DOWN;
        case L: case LW:         return LEFT;
        case R: case RW: case X: return RIGHT;
        case F: case FW: case Z: return FRONT;
        case B: case BW:         return BACK;
        default:                 return UP;
    }
}

Move Move::inverse() const {
    return Move(turn, 4 - amount);
}

std::string moveToString(const Move& move) {
    std::string s = kTurnNames[move.getTurn()];
    switch (move.getAmount()) {
        case 0: s += '0'; break;
        case 2: s += '2'; break;
        case 3: s += '\''; break;
        default: break;
    }
    return s;
}

Move parseMove(const std::string& token) {
    if (token.empty()) {
        throw MoveParseError(token);
    }

    // Split the turn name from the amount suffix
    size_t baseLength = 1;
    if (token.size() >= 2 && token[1] == 'w') {
        baseLength = 2;
    }
    Turn turn = U;
    if (!lookupTurn(token.substr(0, baseLength), turn)) {
        throw MoveParseError(token);
    }

    const std::string suffix = token.substr(baseLength);
    int amount = 0;
    if (suffix.empty() || suffix == "1") {
        amount = 1;
    } else if (suffix == "2" || suffix == "2'") {
        amount = 2;
    } else if (suffix == "'" || suffix == "3") {
        amount = 3;
    } else if (suffix == "0") {
        amount = 0;
    } else {
        throw MoveParseError(token);
    }
    return Move(turn, amount);
}

std::vector<Move> parseMoveSequence(const std::string& text) {
    std::vector<Move> moves;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        moves.push_back(parseMove(token));
    }
    return moves;
}

std::string sequenceToString(const std::vector<Move>& moves) {
    std::string out;
    for (const auto& move : moves) {
        if (!out.empty()) out += ' ';
        out += moveToString(move);
    }
    return out;
}

std::vector<Move> invertSequence(const std::vector<Move>& moves) {
    std::vector<Move> out;
    out.reserve(moves.size());
    for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
        out.push_back(it->inverse());
    }
    return out;
}

std::vector<uint8_t> encodeMoves(const std::vector<Move>& moves) {
    std::vector<uint8_t> bytes;
    bytes.reserve(moves.size() * 2);
    for (const auto& move : moves) {
        bytes.push_back(static_cast<uint8_t>(move.getTurn()));
        bytes.push_back(static_cast<uint8_t>(move.getAmount()));
    }
    return bytes;
}

std::vector<Move> decodeMoves(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 2 != 0) {
        throw DecodeError("move list has odd length " + std::to_string(bytes.size()));
    }
    std::vector<Move> moves;
    moves.reserve(bytes.size() / 2);
    for (size_t i = 0; i < bytes.size(); i += 2) {
        const int tag = bytes[i];
        const int amount = bytes[i + 1];
        if (tag >= TURN_COUNT) {
            throw DecodeError("unknown turn tag " + std::to_string(tag) + " at move " + std::to_string(i / 2));
        }
        if (amount > 3) {
            throw DecodeError("multiplicity " + std::to_string(amount) + " out of range at move " + std::to_string(i / 2));
        }
        moves.emplace_back(static_cast<Turn>(tag), amount);
    }
    return moves;
}

std::ostream& operator<<(std::ostream& os, const Move& move) {
    return os << moveToString(move);
}

} // namespace rubikpow
