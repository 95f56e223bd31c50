#pragma once

// ObstacleMap.h
// Static axis-aligned footprints on the XZ plane plus a square scene
// boundary. Immutable after construction; pure query surface for the
// agent navigator.

#include <glm/glm.hpp>
#include <cstdint>
#include <random>
#include <vector>

namespace Atrium::AI {

// Footprint centred on (centerX, centerZ)
struct Obstacle {
    float centerX = 0.0f;
    float centerZ = 0.0f;
    float width = 0.0f;     // Extent along X
    float depth = 0.0f;     // Extent along Z
};

// Outcome of a rejection-sampling query
struct FreePositionResult {
    glm::vec2 position{0.0f};   // (x, z)
    uint32_t attempts = 0;      // Samples drawn
    bool found = false;         // false = fell back to the caller's position
};

class ObstacleMap {
public:
    static constexpr float kDefaultBoundary = 40.0f;
    static constexpr float kDefaultSampleHalfExtent = 30.0f;
    static constexpr float kDefaultAgentRadius = 2.0f;
    static constexpr uint32_t kDefaultMaxAttempts = 10;

    ObstacleMap() = default;
    explicit ObstacleMap(std::vector<Obstacle> obstacles,
                         float boundary = kDefaultBoundary,
                         float sampleHalfExtent = kDefaultSampleHalfExtent);

    // True when the agent's square footprint (side 2*agentRadius, centred on
    // x,z) overlaps any obstacle (closed intervals) or the point lies outside
    // the boundary.
    [[nodiscard]] bool IsBlocked(float x, float z,
                                 float agentRadius = kDefaultAgentRadius) const;

    // Uniform samples in [-halfExtent, halfExtent]^2 until one is free.
    // After maxAttempts misses the near point is returned unchanged.
    [[nodiscard]] FreePositionResult FindFreePosition(float nearX, float nearZ,
                                                      std::mt19937& rng,
                                                      uint32_t maxAttempts = kDefaultMaxAttempts,
                                                      float agentRadius = kDefaultAgentRadius) const;

    [[nodiscard]] const std::vector<Obstacle>& GetObstacles() const { return m_obstacles; }
    [[nodiscard]] float GetBoundary() const { return m_boundary; }
    [[nodiscard]] float GetSampleHalfExtent() const { return m_sampleHalfExtent; }

    // The office the original scene is built around
    static std::vector<Obstacle> DefaultOfficeObstacles();

private:
    std::vector<Obstacle> m_obstacles;
    float m_boundary = kDefaultBoundary;
    float m_sampleHalfExtent = kDefaultSampleHalfExtent;
};

} // namespace Atrium::AI
