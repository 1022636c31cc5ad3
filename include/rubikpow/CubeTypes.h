#pragma once

#include <array>
#include <cstdint>

namespace rubikpow {

// Face order doubles as the canonical serialization order and tag values.
enum Face : int { UP = 0, DOWN, LEFT, RIGHT, FRONT, BACK };

enum Color : int { WHITE = 0, YELLOW, RED, ORANGE, BLUE, GREEN };

// Side of a face grid that touches a neighboring face
enum Edge : int { EDGE_TOP = 0, EDGE_BOTTOM, EDGE_LEFT, EDGE_RIGHT };

constexpr std::array<Face, 6> kAllFaces = {UP, DOWN, LEFT, RIGHT, FRONT, BACK};

Color solvedColor(Face face);
Face oppositeFace(Face face);
char faceLetter(Face face);
char colorLetter(Color color);
const char* faceName(Face face);

} // namespace rubikpow
