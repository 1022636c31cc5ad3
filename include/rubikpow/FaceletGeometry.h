#pragma once

#include <array>

#include <glm/glm.hpp>

#include "CubeTypes.h"

namespace rubikpow {

class PuzzleState;

struct FaceletIndex {
    Face face;
    int row;
    int col;
};

// 3D placement of facelets. Coordinates are doubled so every facelet center is an
// integer lattice point: the cube spans [-size, size] on each axis, +x = Right,
// +y = Up, +z = Front. Used as an independent reference model for MoveEngine.
class FaceletGeometry {
public:
    static const std::array<glm::ivec3, 6> kFaceDirections;

    static glm::ivec3 faceletPosition(int size, Face face, int row, int col);

    // Inverse of faceletPosition; throws std::out_of_range for a non-facelet point
    static FaceletIndex faceletAt(int size, const glm::ivec3& position);

    // Face whose outward normal is closest to dir
    static Face directionToFace(const glm::vec3& dir);

    // Turns layers by rotating facelet positions with a rotation matrix
    static PuzzleState rotateLayers(const PuzzleState& state, Face face, int firstDepth, int lastDepth, int quarterTurns);
};

} // namespace rubikpow
