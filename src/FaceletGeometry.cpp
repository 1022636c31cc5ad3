#include "rubikpow/FaceletGeometry.h"
#include "rubikpow/PuzzleState.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <glm/gtc/matrix_transform.hpp>

namespace rubikpow {

const std::array<glm::ivec3, 6> FaceletGeometry::kFaceDirections = {
    glm::ivec3(0, 1, 0),   // Up
    glm::ivec3(0, -1, 0),  // Down
    glm::ivec3(-1, 0, 0),  // Left
    glm::ivec3(1, 0, 0),   // Right
    glm::ivec3(0, 0, 1),   // Front
    glm::ivec3(0, 0, -1)   // Back
};

namespace {
int dot(const glm::ivec3& a, const glm::ivec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

// Layer depth of a facelet relative to face, from its offset along the face normal
int layerDepth(int size, int offset) {
    if (offset == size) return 0;
    if (offset == -size) return size - 1;
    return (size - 1 - offset) / 2;
}
} // namespace

glm::ivec3 FaceletGeometry::faceletPosition(int size, Face face, int row, int col) {
    const int n = size;
    const int r = -(n - 1) + 2 * row;
    const int c = -(n - 1) + 2 * col;
    switch (face) {
        case UP:    return glm::ivec3(c, n, r);
        case DOWN:  return glm::ivec3(c, -n, -r);
        case LEFT:  return glm::ivec3(-n, -r, c);
        case RIGHT: return glm::ivec3(n, -r, -c);
        case FRONT: return glm::ivec3(c, -r, n);
        case BACK:  return glm::ivec3(-c, -r, -n);
    }
    return glm::ivec3(0);
}

FaceletIndex FaceletGeometry::faceletAt(int size, const glm::ivec3& position) {
    const int n = size;
    const Face face = directionToFace(glm::vec3(position));
    if (dot(position, kFaceDirections[face]) != n) {
        throw std::out_of_range("point is not on a cube face");
    }

    int u = 0;
    int v = 0;
    switch (face) {
        case UP:    u = position.z;  v = position.x;  break;
        case DOWN:  u = -position.z; v = position.x;  break;
        case LEFT:  u = -position.y; v = position.z;  break;
        case RIGHT: u = -position.y; v = -position.z; break;
        case FRONT: u = -position.y; v = position.x;  break;
        case BACK:  u = -position.y; v = -position.x; break;
    }
    const int row2 = u + n - 1;
    const int col2 = v + n - 1;
    if (row2 < 0 || col2 < 0 || row2 % 2 != 0 || col2 % 2 != 0 || row2 / 2 >= n || col2 / 2 >= n) {
        throw std::out_of_range("point is not a facelet center");
    }
    return FaceletIndex{face, row2 / 2, col2 / 2};
}

Face FaceletGeometry::directionToFace(const glm::vec3& dir) {
    float bestDot = -std::numeric_limits<float>::infinity();
    int bestIdx = 0;
    for (int i = 0; i < static_cast<int>(kFaceDirections.size()); ++i) {
        const float d = glm::dot(dir, glm::vec3(kFaceDirections[i]));
        if (d > bestDot) {
            bestDot = d;
            bestIdx = i;
        }
    }
    return static_cast<Face>(bestIdx);
}

PuzzleState FaceletGeometry::rotateLayers(const PuzzleState& state, Face face, int firstDepth, int lastDepth, int quarterTurns) {
    const int n = state.getSize();
    firstDepth = std::max(firstDepth, 0);
    lastDepth = std::min(lastDepth, n - 1);
    const int turns = ((quarterTurns % 4) + 4) % 4;

    PuzzleState result = state;
    if (firstDepth > lastDepth || turns == 0) {
        return result;
    }

    // Clockwise seen from outside the face is a negative angle about its outward normal
    const glm::ivec3 normal = kFaceDirections[face];
    const glm::mat4 rotation4 = glm::rotate(glm::mat4(1.0f), glm::radians(-90.0f * turns), glm::vec3(normal));
    const glm::mat3 rotation3(rotation4);

    for (Face source : kAllFaces) {
        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                const glm::ivec3 pos = faceletPosition(n, source, row, col);
                const int depth = layerDepth(n, dot(pos, normal));
                if (depth < firstDepth || depth > lastDepth) {
                    continue;
                }
                const glm::vec3 rotated = rotation3 * glm::vec3(pos);
                const glm::ivec3 snapped(static_cast<int>(std::round(rotated.x)),
                                         static_cast<int>(std::round(rotated.y)),
                                         static_cast<int>(std::round(rotated.z)));
                const FaceletIndex target = faceletAt(n, snapped);
                result.grid(target.face)[target.row * n + target.col] = state.at(source, row, col);
            }
        }
    }
    return result;
}

} // namespace rubikpow
