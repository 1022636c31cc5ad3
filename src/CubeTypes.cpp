#include "rubikpow/CubeTypes.h"

namespace rubikpow {

Color solvedColor(Face face) {
    switch (face) {
        case UP:    return WHITE;
        case DOWN:  return YELLOW;
        case FRONT: return RED;
        case BACK:  return ORANGE;
        case LEFT:  return BLUE;
        case RIGHT: return GREEN;
    }
    return WHITE;
}

Face oppositeFace(Face face) {
    switch (face) {
        case UP:    return DOWN;
        case DOWN:  return UP;
        case LEFT:  return RIGHT;
        case RIGHT: return LEFT;
        case FRONT: return BACK;
        case BACK:  return FRONT;
    }
    return UP;
}

char faceLetter(Face face) {
    static const char letters[] = {'U', 'D', 'L', 'R', 'F', 'B'};
    return letters[face];
}

char colorLetter(Color color) {
    static const char letters[] = {'W', 'Y', 'R', 'O', 'B', 'G'};
    return letters[color];
}

const char* faceName(Face face) {
    static const char* names[] = {"Up", "Down", "Left", "Right", "Front", "Back"};
    return names[face];
}

} // namespace rubikpow
