// =====================================================
// Cancellable Delay Unit Tests
// =====================================================
// Timing assertions use generous bounds so they hold on
// a loaded CI machine.
// =====================================================

#include <unity.h>
#include <thread>
#include "cancellable_delay.h"
#include "platform_timing.h"

void setUp() {
    platform_timing_init();
}

void tearDown() {}

// =====================================================
// Test Cases
// =====================================================

void test_wait_runs_full_duration() {
    CancellableDelay delay;

    uint32_t begin = platform_millis();
    TEST_ASSERT_FALSE(delay.wait(50));
    uint32_t elapsed = platform_millis() - begin;

    TEST_ASSERT_GREATER_OR_EQUAL(45, elapsed);
    TEST_ASSERT_FALSE(delay.isCancelled());
}

void test_wait_after_cancel_returns_immediately() {
    CancellableDelay delay;
    delay.cancel();

    uint32_t begin = platform_millis();
    TEST_ASSERT_TRUE(delay.wait(5000));
    TEST_ASSERT_LESS_THAN(100, platform_millis() - begin);

    // Stays cancelled for later waits
    TEST_ASSERT_TRUE(delay.wait(5000));
    TEST_ASSERT_TRUE(delay.isCancelled());
}

void test_cancel_wakes_waiter_from_other_thread() {
    CancellableDelay delay;

    std::thread canceller([&delay] {
        platform_delay_ms(50);
        delay.cancel();
    });

    uint32_t begin = platform_millis();
    bool cancelled = delay.wait(5000);
    uint32_t elapsed = platform_millis() - begin;
    canceller.join();

    TEST_ASSERT_TRUE(cancelled);
    TEST_ASSERT_LESS_THAN(1000, elapsed);
}

void test_reset_clears_signal() {
    CancellableDelay delay;
    delay.cancel();
    delay.reset();

    TEST_ASSERT_FALSE(delay.isCancelled());
    TEST_ASSERT_FALSE(delay.wait(10));
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_wait_runs_full_duration);
    RUN_TEST(test_wait_after_cancel_returns_immediately);
    RUN_TEST(test_cancel_wakes_waiter_from_other_thread);
    RUN_TEST(test_reset_clears_signal);

    return UNITY_END();
}
