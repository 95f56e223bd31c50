// test_tween_system.cpp
// Unit tests for the tween system: timing, easing endpoints, newest-wins
// cancellation and callback ordering.

#include "Animation/Easing.h"
#include "Animation/TweenSystem.h"
#include <cmath>
#include <iostream>
#include <utility>

using namespace Atrium::Animation;

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

static bool Near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) <= eps;
}

static TweenParams Linear(double durationMs, double delayMs = 0.0) {
    TweenParams params;
    params.durationMs = durationMs;
    params.delayMs = delayMs;
    params.ease = Ease::Linear;
    return params;
}

// ============================================================================
// Easing
// ============================================================================

bool test_ease_endpoints() {
    for (Ease ease : {Ease::Linear, Ease::Power2In, Ease::Power2Out, Ease::Power2InOut, Ease::SineInOut, Ease::BackOut}) {
        TEST_ASSERT(Near(ApplyEase(ease, 0.0f), 0.0f), "Ease should start at 0: " << EaseName(ease));
        TEST_ASSERT(Near(ApplyEase(ease, 1.0f), 1.0f), "Ease should end at 1: " << EaseName(ease));
    }
    TEST_PASS();
}

bool test_ease_clamps_input() {
    TEST_ASSERT(Near(ApplyEase(Ease::Power2InOut, -1.0f), 0.0f), "Negative t clamps to 0");
    TEST_ASSERT(Near(ApplyEase(Ease::Power2InOut, 2.0f), 1.0f), "t > 1 clamps to 1");
    TEST_PASS();
}

bool test_back_out_overshoots() {
    bool overshoot = false;
    for (int i = 1; i < 100; ++i) {
        if (ApplyEase(Ease::BackOut, static_cast<float>(i) / 100.0f) > 1.0f) overshoot = true;
    }
    TEST_ASSERT(overshoot, "BackOut should overshoot before settling");
    TEST_PASS();
}

// ============================================================================
// Tweens
// ============================================================================

bool test_linear_progress_and_snap() {
    TweenSystem tweens;
    float value = 0.0f;
    tweens.Update(0.0);
    tweens.To(&value, 10.0f, Linear(1000.0));

    tweens.Update(0.0);
    TEST_ASSERT(Near(value, 0.0f), "Start value captured at first sample");
    tweens.Update(500.0);
    TEST_ASSERT(Near(value, 5.0f), "Halfway through a linear tween");
    tweens.Update(1200.0);
    TEST_ASSERT(value == 10.0f, "Lands exactly on the target");
    TEST_ASSERT(tweens.GetActiveCount() == 0, "Finished tween is removed");
    TEST_PASS();
}

bool test_delay_holds_value() {
    TweenSystem tweens;
    float value = 2.0f;
    tweens.FromTo(&value, 0.0f, 1.0f, Linear(100.0, 200.0));

    tweens.Update(100.0);
    TEST_ASSERT(Near(value, 2.0f), "Untouched during the delay");
    tweens.Update(250.0);
    TEST_ASSERT(Near(value, 0.5f), "FromTo starts from its explicit value");
    TEST_PASS();
}

bool test_newest_tween_wins() {
    TweenSystem tweens;
    float value = 0.0f;
    bool firstCompleted = false;

    TweenParams first = Linear(1000.0);
    first.onComplete = [&]() { firstCompleted = true; };
    const TweenHandle a = tweens.To(&value, 100.0f, std::move(first));

    tweens.Update(500.0);
    const TweenHandle b = tweens.To(&value, -10.0f, Linear(100.0));
    TEST_ASSERT(!tweens.IsActive(a), "Older tween cancelled by a new one on the same property");
    TEST_ASSERT(tweens.IsActive(b), "New tween active");

    tweens.Update(2000.0);
    TEST_ASSERT(value == -10.0f, "Property ends at the newest target");
    TEST_ASSERT(!firstCompleted, "Cancelled tween never completes");
    TEST_PASS();
}

bool test_vector_tween() {
    TweenSystem tweens;
    glm::vec3 position(0.0f);
    tweens.To(&position, glm::vec3(10.0f, 20.0f, -30.0f), Linear(100.0));

    tweens.Update(0.0);
    tweens.Update(50.0);
    TEST_ASSERT(Near(position.x, 5.0f) && Near(position.y, 10.0f) && Near(position.z, -15.0f), "Component-wise interpolation");
    tweens.Update(100.0);
    TEST_ASSERT(position == glm::vec3(10.0f, 20.0f, -30.0f), "Vector lands on target");
    TEST_PASS();
}

bool test_kill_tweens_of() {
    TweenSystem tweens;
    float a = 0.0f;
    float b = 0.0f;
    tweens.To(&a, 1.0f, Linear(100.0));
    tweens.To(&b, 1.0f, Linear(100.0));

    tweens.KillTweensOf(&a);
    TEST_ASSERT(!tweens.IsAnimating(&a), "Killed property no longer animating");
    TEST_ASSERT(tweens.IsAnimating(&b), "Other property unaffected");

    tweens.Update(200.0);
    TEST_ASSERT(a == 0.0f && b == 1.0f, "Only the surviving tween writes");
    TEST_PASS();
}

bool test_callbacks_may_start_tweens() {
    TweenSystem tweens;
    float value = 0.0f;
    float chained = 0.0f;

    TweenParams params = Linear(100.0);
    params.onComplete = [&]() { tweens.To(&chained, 5.0f, Linear(100.0)); };
    tweens.To(&value, 1.0f, std::move(params));

    tweens.Update(100.0);
    TEST_ASSERT(value == 1.0f, "First tween finished");
    TEST_ASSERT(tweens.IsAnimating(&chained), "Completion started a new tween");
    tweens.Update(200.0);
    TEST_ASSERT(chained == 5.0f, "Chained tween ran from the completion time");
    TEST_PASS();
}

bool test_update_callback_skipped_after_cancel() {
    TweenSystem tweens;
    float a = 0.0f;
    float b = 0.0f;
    int bUpdates = 0;
    TweenHandle bHandle = kInvalidTween;

    TweenParams pa = Linear(100.0);
    pa.onUpdate = [&]() { tweens.Cancel(bHandle); };
    tweens.To(&a, 1.0f, std::move(pa));

    TweenParams pb = Linear(100.0);
    pb.onUpdate = [&]() { ++bUpdates; };
    bHandle = tweens.To(&b, 1.0f, std::move(pb));

    tweens.Update(50.0);
    TEST_ASSERT(bUpdates == 0, "A tween cancelled earlier in the frame gets no update callback");
    TEST_PASS();
}

bool test_invalid_inputs_are_noops() {
    TweenSystem tweens;
    TEST_ASSERT(tweens.To(static_cast<float*>(nullptr), 1.0f, Linear(10.0)) == kInvalidTween, "Null property rejected");
    tweens.Cancel(kInvalidTween);
    tweens.Cancel(12345);
    TEST_ASSERT(!tweens.IsActive(kInvalidTween), "Invalid handle never active");
    TEST_PASS();
}

int main() {
    std::cout << "================================================" << std::endl;
    std::cout << "Tween System Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_ease_endpoints();
    test_ease_clamps_input();
    test_back_out_overshoots();

    std::cout << "\n--- Tweens ---" << std::endl;
    test_linear_progress_and_snap();
    test_delay_holds_value();
    test_newest_tween_wins();
    test_vector_tween();
    test_kill_tweens_of();
    test_callbacks_may_start_tweens();
    test_update_callback_skipped_after_cancel();
    test_invalid_inputs_are_noops();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
