// test_obstacle_map.cpp
// Unit tests for the static obstacle map: inflated-footprint collision,
// boundary handling and rejection-sampled free positions.

#include "AI/ObstacleMap.h"
#include <iostream>
#include <random>
#include <vector>

using namespace Atrium::AI;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

// ============================================================================
// Collision
// ============================================================================

bool test_open_floor_is_free() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    TEST_ASSERT(!map.IsBlocked(-15.0f, 15.0f), "Open floor should be free");
    TEST_ASSERT(!map.IsBlocked(-25.0f, 20.0f), "Agent spawn point should be free");
    TEST_PASS();
}

bool test_desk_blocks_inflated_footprint() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    // Desk spans x in [-7, 7]; with radius 2 anything up to x = 9 overlaps
    TEST_ASSERT(map.IsBlocked(0.0f, 0.0f), "Desk centre should be blocked");
    TEST_ASSERT(map.IsBlocked(8.9f, -2.0f), "Inflated footprint should reach past the desk edge");
    TEST_ASSERT(!map.IsBlocked(-9.5f, -2.0f), "Beyond radius of the desk edge should be free");
    TEST_PASS();
}

bool test_touching_edge_counts_as_overlap() {
    ObstacleMap map(std::vector<Obstacle>{{0.0f, 0.0f, 4.0f, 4.0f}});
    // Obstacle edge at x = 2, footprint edge at x - 2 = 2
    TEST_ASSERT(map.IsBlocked(4.0f, 0.0f, 2.0f), "Closed intervals: touching edges overlap");
    TEST_ASSERT(!map.IsBlocked(4.01f, 0.0f, 2.0f), "Just past the edge is free");
    TEST_PASS();
}

bool test_boundary_blocks_outside() {
    ObstacleMap map(std::vector<Obstacle>{}, 40.0f);
    TEST_ASSERT(!map.IsBlocked(40.0f, 0.0f), "Exactly on the boundary is inside");
    TEST_ASSERT(map.IsBlocked(40.01f, 0.0f), "Past +X boundary is blocked");
    TEST_ASSERT(map.IsBlocked(0.0f, -40.5f), "Past -Z boundary is blocked");
    TEST_PASS();
}

bool test_radius_zero_is_point_query() {
    ObstacleMap map(std::vector<Obstacle>{{10.0f, 10.0f, 2.0f, 2.0f}});
    TEST_ASSERT(map.IsBlocked(10.5f, 10.5f, 0.0f), "Point inside obstacle");
    TEST_ASSERT(!map.IsBlocked(11.5f, 10.0f, 0.0f), "Point outside obstacle");
    TEST_PASS();
}

// ============================================================================
// Free position sampling
// ============================================================================

bool test_free_position_is_unblocked_and_in_range() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    std::mt19937 rng(1234);

    for (int i = 0; i < 200; ++i) {
        const auto result = map.FindFreePosition(-25.0f, 20.0f, rng);
        if (!result.found) continue;
        TEST_ASSERT(!map.IsBlocked(result.position.x, result.position.y), "Sampled point must be free");
        TEST_ASSERT(result.position.x >= -30.0f && result.position.x <= 30.0f, "x within sample range");
        TEST_ASSERT(result.position.y >= -30.0f && result.position.y <= 30.0f, "z within sample range");
        TEST_ASSERT(result.attempts >= 1 && result.attempts <= 10, "Attempts within budget");
    }
    TEST_PASS();
}

bool test_exhausted_sampling_returns_near_point() {
    // One obstacle covering the whole sample range
    ObstacleMap map(std::vector<Obstacle>{{0.0f, 0.0f, 100.0f, 100.0f}});
    std::mt19937 rng(7);

    const auto result = map.FindFreePosition(3.5f, -4.25f, rng, 10);
    TEST_ASSERT(!result.found, "Nothing can be free");
    TEST_ASSERT(result.attempts == 10, "Should use exactly maxAttempts samples");
    TEST_ASSERT(result.position.x == 3.5f && result.position.y == -4.25f, "Near point returned unchanged");
    TEST_PASS();
}

bool test_custom_attempt_budget() {
    ObstacleMap map(std::vector<Obstacle>{{0.0f, 0.0f, 100.0f, 100.0f}});
    std::mt19937 rng(99);

    const auto result = map.FindFreePosition(0.0f, 0.0f, rng, 3);
    TEST_ASSERT(result.attempts == 3, "Custom budget honoured");
    TEST_PASS();
}

bool test_same_seed_same_samples() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    std::mt19937 a(42);
    std::mt19937 b(42);

    const auto ra = map.FindFreePosition(0.0f, 0.0f, a);
    const auto rb = map.FindFreePosition(0.0f, 0.0f, b);
    TEST_ASSERT(ra.position == rb.position && ra.attempts == rb.attempts, "Deterministic for a fixed seed");
    TEST_PASS();
}

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Obstacle Map Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_open_floor_is_free();
    test_desk_blocks_inflated_footprint();
    test_touching_edge_counts_as_overlap();
    test_boundary_blocks_outside();
    test_radius_zero_is_point_query();

    std::cout << "\n--- Free Position Sampling ---" << std::endl;
    test_free_position_is_unblocked_and_in_range();
    test_exhausted_sampling_returns_near_point();
    test_custom_attempt_budget();
    test_same_seed_same_samples();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
