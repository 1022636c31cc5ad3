#include "rubikpow/PuzzleState.h"
#include "rubikpow/Constants.h"
#include "rubikpow/Errors.h"
#include "rubikpow/MoveEngine.h"

#include <iostream>

namespace rubikpow {

PuzzleState::PuzzleState(int size) : size(size) {
    if (size < MIN_PUZZLE_SIZE) {
        throw SizeError(size, MIN_PUZZLE_SIZE);
    }
    for (Face face : kAllFaces) {
        facelets[face].assign(static_cast<size_t>(size) * size, solvedColor(face));
    }
}

PuzzleState::PuzzleState(int size, std::array<FaceGrid, 6> grids)
    : size(size), facelets(std::move(grids)) {}

PuzzleState PuzzleState::fromCanonical(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 4) {
        throw DecodeError("serialized state shorter than its size field");
    }
    const uint32_t rawSize = static_cast<uint32_t>(bytes[0]) |
                             (static_cast<uint32_t>(bytes[1]) << 8) |
                             (static_cast<uint32_t>(bytes[2]) << 16) |
                             (static_cast<uint32_t>(bytes[3]) << 24);
    if (rawSize < static_cast<uint32_t>(MIN_PUZZLE_SIZE) || rawSize > static_cast<uint32_t>(MAX_DECODED_SIZE)) {
        throw DecodeError("serialized state has unsupported size " + std::to_string(rawSize));
    }
    const int n = static_cast<int>(rawSize);
    const size_t cells = static_cast<size_t>(n) * n;
    if (bytes.size() != 4 + NUM_FACES * (1 + cells)) {
        throw DecodeError("serialized state length does not match size " + std::to_string(n));
    }

    std::array<FaceGrid, 6> grids;
    std::array<size_t, 6> counts{};
    size_t offset = 4;
    for (Face face : kAllFaces) {
        if (bytes[offset] != static_cast<uint8_t>(face)) {
            throw DecodeError("unexpected face tag " + std::to_string(bytes[offset]) +
                              " where " + faceName(face) + " was expected");
        }
        ++offset;
        grids[face].reserve(cells);
        for (size_t i = 0; i < cells; ++i, ++offset) {
            const uint8_t tag = bytes[offset];
            if (tag >= NUM_COLORS) {
                throw DecodeError("unknown color tag " + std::to_string(tag));
            }
            grids[face].push_back(static_cast<Color>(tag));
            ++counts[tag];
        }
    }
    for (size_t count : counts) {
        if (count != cells) {
            throw DecodeError("color counts do not match a " + std::to_string(n) + "x" +
                              std::to_string(n) + "x" + std::to_string(n) + " cube");
        }
    }
    return PuzzleState(n, std::move(grids));
}

void PuzzleState::applyMove(const Move& move) {
    MoveEngine::apply(*this, move);
}

void PuzzleState::applyMoves(const std::vector<Move>& moves) {
    for (const auto& move : moves) {
        MoveEngine::apply(*this, move);
    }
}

bool PuzzleState::isSolved() const {
    for (Face face : kAllFaces) {
        const FaceGrid& cells = facelets[face];
        // Any cell works as the reference; even sizes have no true center
        const Color reference = cells.front();
        for (Color color : cells) {
            if (color != reference) {
                return false;
            }
        }
    }
    return true;
}

std::vector<uint8_t> PuzzleState::canonicalSerialize() const {
    const size_t cells = static_cast<size_t>(size) * size;
    std::vector<uint8_t> bytes;
    bytes.reserve(4 + NUM_FACES * (1 + cells));

    const uint32_t n = static_cast<uint32_t>(size);
    bytes.push_back(static_cast<uint8_t>(n & 0xFF));
    bytes.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
    bytes.push_back(static_cast<uint8_t>((n >> 24) & 0xFF));

    for (Face face : kAllFaces) {
        bytes.push_back(static_cast<uint8_t>(face));
        for (Color color : facelets[face]) {
            bytes.push_back(static_cast<uint8_t>(color));
        }
    }
    return bytes;
}

std::array<int, 6> PuzzleState::colorCounts() const {
    std::array<int, 6> counts{};
    for (const auto& cells : facelets) {
        for (Color color : cells) {
            ++counts[color];
        }
    }
    return counts;
}

void PuzzleState::print(std::ostream& os) const {
    os << "=== " << size << "x" << size << "x" << size << " cube ===\n";
    for (Face face : kAllFaces) {
        os << faceName(face) << ":\n";
        for (int row = 0; row < size; ++row) {
            os << "  ";
            for (int col = 0; col < size; ++col) {
                os << colorLetter(at(face, row, col)) << ' ';
            }
            os << '\n';
        }
    }
    os << "Solved: " << (isSolved() ? "YES" : "NO") << '\n';
}

void PuzzleState::printState() const {
    print(std::cout);
    std::cout << std::flush;
}

bool PuzzleState::operator==(const PuzzleState& other) const {
    return size == other.size && facelets == other.facelets;
}

std::ostream& operator<<(std::ostream& os, const PuzzleState& state) {
    state.print(os);
    return os;
}

} // namespace rubikpow
