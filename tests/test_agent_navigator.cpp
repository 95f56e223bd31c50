// test_agent_navigator.cpp
// Unit tests for the autonomous agent: retarget cadence, collision
// invariant, suspension and locomotion bookkeeping.

#include "AI/AgentNavigator.h"
#include "AI/ObstacleMap.h"
#include "Animation/TweenSystem.h"
#include <cmath>
#include <iostream>
#include <vector>

using namespace Atrium;
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

static constexpr double kFrameMs = 1000.0 / 60.0;

static NavigatorParams SeededParams(uint32_t seed) {
    NavigatorParams params;
    params.seed = seed;
    return params;
}

// ============================================================================
// Tests
// ============================================================================

bool test_ten_seconds_on_open_floor() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(11));

    nav.Reset(glm::vec2(0.0f), 0.0);
    for (double now = 0.0; now <= 10000.0; now += kFrameMs) {
        nav.Update(now);
        const auto& s = nav.GetState();
        TEST_ASSERT(std::abs(s.position.x) <= 40.0f && std::abs(s.position.y) <= 40.0f,
                    "Agent left the boundary at t=" << now);
    }
    TEST_ASSERT(nav.GetState().retargetCount >= 1, "At least one retarget in 10 s");
    TEST_ASSERT(nav.GetState().distanceTravelled > 0.0f, "Agent should have moved");
    TEST_PASS();
}

bool test_retarget_interval_within_bounds() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(3));

    nav.Reset(glm::vec2(-25.0f, 20.0f), 0.0);
    uint32_t lastCount = 0;
    double lastRetarget = -1.0;
    int gaps = 0;

    for (double now = 0.0; now <= 60000.0; now += kFrameMs) {
        nav.Update(now);
        const auto& s = nav.GetState();
        TEST_ASSERT(s.retargetIntervalMs >= 3000.0 && s.retargetIntervalMs <= 5000.0,
                    "Interval drawn outside [3000, 5000]: " << s.retargetIntervalMs);
        if (s.retargetCount != lastCount) {
            if (lastRetarget >= 0.0) {
                const double gap = now - lastRetarget;
                TEST_ASSERT(gap >= 3000.0 && gap <= 5000.0 + 2.0 * kFrameMs,
                            "Retarget gap out of range: " << gap);
                ++gaps;
            }
            lastRetarget = now;
            lastCount = s.retargetCount;
        }
    }
    TEST_ASSERT(gaps >= 10, "Expected a dozen retargets in a minute, got " << gaps);
    TEST_PASS();
}

bool test_never_enters_obstacle() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    Animation::TweenSystem tweens;
    NavigatorParams params = SeededParams(2024);
    params.moveSpeed = 0.3f;
    AgentNavigator nav(map, tweens, params);

    nav.Spawn(0.0);
    TEST_ASSERT(!map.IsBlocked(nav.GetState().position.x, nav.GetState().position.y), "Spawn point must be free");

    for (double now = 0.0; now <= 120000.0; now += kFrameMs) {
        nav.Update(now);
        const auto& s = nav.GetState();
        TEST_ASSERT(!map.IsBlocked(s.position.x, s.position.y), "Agent footprint overlapped an obstacle at t=" << now);
    }
    TEST_PASS();
}

bool test_spawn_prefers_free_start() {
    ObstacleMap map(ObstacleMap::DefaultOfficeObstacles());
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(5));

    nav.Spawn(0.0);
    TEST_ASSERT(nav.GetState().position == glm::vec2(-25.0f, 20.0f), "Free start point used as-is");
    TEST_ASSERT(nav.GetMotionState() == AgentMotionState::Idle, "Spawned idle");
    TEST_PASS();
}

bool test_collision_retargets_without_moving() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    NavigatorParams params = SeededParams(31);
    // Every step overshoots the boundary
    params.moveSpeed = 100.0f;
    params.arrivalDistance = 0.0f;
    AgentNavigator nav(map, tweens, params);

    nav.Reset(glm::vec2(0.0f), 0.0);
    nav.Update(0.0);
    const auto& s = nav.GetState();
    TEST_ASSERT(s.retargetCount == 1, "Timer retarget on the first tick");
    TEST_ASSERT(s.collisionRetargets == 1, "Blocked step forces a new target");
    TEST_ASSERT(s.position == glm::vec2(0.0f), "Agent does not move on a blocked step");
    TEST_ASSERT(s.distanceTravelled == 0.0f && s.wheelSpin == 0.0f, "No locomotion on a blocked step");

    const double timerStart = s.lastRetargetMs;
    for (int frame = 1; frame <= 10; ++frame) {
        const glm::vec2 target = nav.GetState().targetPosition;
        nav.Update(frame * kFrameMs);
        TEST_ASSERT(nav.GetState().collisionRetargets == static_cast<uint32_t>(1 + frame), "One collision per tick");
        TEST_ASSERT(nav.GetState().position == glm::vec2(0.0f), "Still in place at frame " << frame);
        TEST_ASSERT(nav.GetState().targetPosition != target, "Target replaced at frame " << frame);
    }
    TEST_ASSERT(nav.GetState().retargetCount == 1, "Collisions are not timer retargets");
    TEST_ASSERT(nav.GetState().lastRetargetMs == timerStart, "Collisions leave the retarget timer alone");
    TEST_PASS();
}

bool test_spawn_retries_when_start_blocked() {
    // West half of the sampling square is solid; the start sits inside it
    ObstacleMap map(std::vector<Obstacle>{Obstacle{-15.0f, 0.0f, 30.0f, 60.0f}});
    Animation::TweenSystem tweens;
    NavigatorParams params = SeededParams(17);
    params.maxAttempts = 1;
    AgentNavigator nav(map, tweens, params);

    TEST_ASSERT(map.IsBlocked(params.start.x, params.start.y), "Start point is blocked");
    nav.Spawn(0.0);
    const auto& s = nav.GetState();
    TEST_ASSERT(!map.IsBlocked(s.position.x, s.position.y), "Spawn keeps sampling until it finds free floor");
    TEST_PASS();
}

bool test_spawn_on_solid_floor_holds_start() {
    ObstacleMap map(std::vector<Obstacle>{Obstacle{0.0f, 0.0f, 100.0f, 100.0f}});
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(19));

    nav.Spawn(0.0);
    TEST_ASSERT(nav.GetState().position == nav.GetParams().start, "No free floor: stays at the preferred start");
    TEST_ASSERT(nav.GetMotionState() == AgentMotionState::Idle, "Spawned idle");
    TEST_PASS();
}

bool test_suspend_freezes_and_resume_retargets() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(8));

    nav.Reset(glm::vec2(0.0f), 0.0);
    double now = 0.0;
    for (; now < 1000.0; now += kFrameMs) nav.Update(now);

    nav.Suspend();
    TEST_ASSERT(nav.IsSuspended(), "Suspended state");
    const glm::vec2 frozen = nav.GetState().position;
    const uint32_t retargets = nav.GetState().retargetCount;

    // Longer than any retarget interval
    for (; now < 12000.0; now += kFrameMs) nav.Update(now);
    TEST_ASSERT(nav.GetState().position == frozen, "No movement while suspended");
    TEST_ASSERT(nav.GetState().retargetCount == retargets, "No retargets while suspended");

    nav.Resume(now);
    TEST_ASSERT(nav.GetMotionState() == AgentMotionState::Idle, "Resume returns to Idle");
    nav.Update(now + kFrameMs);
    TEST_ASSERT(nav.GetState().retargetCount == retargets + 1, "First tick after resume retargets");
    TEST_ASSERT(nav.GetMotionState() == AgentMotionState::Moving, "Moving after the resume retarget");
    TEST_PASS();
}

bool test_face_towards_only_while_suspended() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(9));
    nav.Reset(glm::vec2(0.0f), 0.0);

    const float before = nav.GetState().heading;
    nav.FaceTowards(glm::vec3(10.0f, 0.0f, 0.0f));
    TEST_ASSERT(nav.GetState().heading == before, "Ignored while not suspended");

    nav.Suspend();
    for (int i = 0; i < 200; ++i) nav.FaceTowards(glm::vec3(10.0f, 0.0f, 0.0f));
    TEST_ASSERT(std::abs(nav.GetState().heading - 1.5707963f) < 1e-3f, "Converges on +X (yaw pi/2)");
    TEST_PASS();
}

bool test_wheel_spin_matches_distance() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    NavigatorParams params = SeededParams(21);
    params.wheelRadius = 0.5f;
    AgentNavigator nav(map, tweens, params);

    nav.Reset(glm::vec2(0.0f), 0.0);
    for (double now = 0.0; now <= 5000.0; now += kFrameMs) nav.Update(now);

    const auto& s = nav.GetState();
    TEST_ASSERT(s.distanceTravelled > 0.0f, "Agent moved");
    TEST_ASSERT(std::abs(s.wheelSpin - s.distanceTravelled / 0.5f) < 1e-3f, "Rolling without slipping");
    TEST_PASS();
}

bool test_reset_makes_retarget_due() {
    ObstacleMap map(std::vector<Obstacle>{});
    Animation::TweenSystem tweens;
    AgentNavigator nav(map, tweens, SeededParams(13));

    nav.Reset(glm::vec2(5.0f, -5.0f), 1000.0);
    TEST_ASSERT(nav.GetState().retargetCount == 0, "No retarget before the first tick");
    nav.Update(1000.0);
    TEST_ASSERT(nav.GetState().retargetCount == 1, "Retarget on the first tick after reset");
    TEST_PASS();
}

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Agent Navigator Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_ten_seconds_on_open_floor();
    test_retarget_interval_within_bounds();
    test_never_enters_obstacle();
    test_spawn_prefers_free_start();
    test_spawn_retries_when_start_blocked();
    test_spawn_on_solid_floor_holds_start();
    test_collision_retargets_without_moving();
    test_suspend_freezes_and_resume_retargets();
    test_face_towards_only_while_suspended();
    test_wheel_spin_matches_distance();
    test_reset_makes_retarget_due();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
