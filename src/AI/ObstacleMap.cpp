#include "ObstacleMap.h"
#include <cmath>
#include <utility>

namespace Atrium::AI {

ObstacleMap::ObstacleMap(std::vector<Obstacle> obstacles, float boundary, float sampleHalfExtent)
    : m_obstacles(std::move(obstacles))
    , m_boundary(boundary)
    , m_sampleHalfExtent(sampleHalfExtent) {
}

bool ObstacleMap::IsBlocked(float x, float z, float agentRadius) const {
    for (const auto& obstacle : m_obstacles) {
        const float minX = obstacle.centerX - obstacle.width * 0.5f;
        const float maxX = obstacle.centerX + obstacle.width * 0.5f;
        const float minZ = obstacle.centerZ - obstacle.depth * 0.5f;
        const float maxZ = obstacle.centerZ + obstacle.depth * 0.5f;

        // Closed-interval overlap of the inflated footprint
        if (x + agentRadius >= minX && x - agentRadius <= maxX &&
            z + agentRadius >= minZ && z - agentRadius <= maxZ) {
            return true;
        }
    }

    return std::abs(x) > m_boundary || std::abs(z) > m_boundary;
}

FreePositionResult ObstacleMap::FindFreePosition(float nearX, float nearZ,
                                                 std::mt19937& rng,
                                                 uint32_t maxAttempts,
                                                 float agentRadius) const {
    std::uniform_real_distribution<float> dist(-m_sampleHalfExtent, m_sampleHalfExtent);

    FreePositionResult result;
    for (uint32_t i = 0; i < maxAttempts; ++i) {
        const float x = dist(rng);
        const float z = dist(rng);
        result.attempts = i + 1;

        if (!IsBlocked(x, z, agentRadius)) {
            result.position = glm::vec2(x, z);
            result.found = true;
            return result;
        }
    }

    result.position = glm::vec2(nearX, nearZ);
    result.found = false;
    return result;
}

std::vector<Obstacle> ObstacleMap::DefaultOfficeObstacles() {
    return {
        {0.0f, 0.0f, 14.0f, 8.0f},      // Main desk
        {0.0f, 5.0f, 3.0f, 3.0f},       // Chair
        {15.0f, -8.0f, 8.0f, 6.0f},     // Second desk
        {8.0f, 2.0f, 2.0f, 2.0f},       // Tower
        {-25.0f, 0.0f, 4.0f, 4.0f},     // Projectors
        {0.0f, -30.0f, 4.0f, 4.0f},
        {25.0f, 0.0f, 4.0f, 4.0f},
        {0.0f, 25.0f, 4.0f, 4.0f},
    };
}

} // namespace Atrium::AI
