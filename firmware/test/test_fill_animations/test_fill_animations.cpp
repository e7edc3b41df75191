// =====================================================
// Fill Animation Unit Tests
// =====================================================
// Tests Fill and the Refill/Bounce composites built on
// top of it.
// =====================================================

#include <unity.h>
#include <thread>
#include "../mock_led_strip.h"
#include "led_animations.h"
#include "led_log.h"
#include "platform_timing.h"

// =====================================================
// Test Fixtures
// =====================================================

static const Color GREEN = {0, 180, 0};
static const Color BLUE = {0, 0, 255};

static int g_warnings = 0;

static void captureLog(LogLevel level, const char* tag, const char* message) {
    (void)tag;
    (void)message;
    if (level == LogLevel::Warning) g_warnings++;
}

void setUp() {
    platform_timing_init();
    g_warnings = 0;
    log_set_sink(captureLog);
}

void tearDown() {
    log_set_sink(nullptr);
}

// Expect SetLed calls [first, first + count) to walk the given
// index order with the given color
static void assertSweep(const std::vector<MockLedStrip::Call>& sets, size_t first,
                        const size_t* order, size_t count, Color color) {
    TEST_ASSERT_TRUE(sets.size() >= first + count);
    for (size_t i = 0; i < count; i++) {
        TEST_ASSERT_EQUAL(order[i], sets[first + i].index);
        TEST_ASSERT_TRUE(sets[first + i].color == color);
    }
}

static const size_t FORWARD[] = {0, 1, 2, 3};
static const size_t BACKWARD[] = {3, 2, 1, 0};

// =====================================================
// Fill
// =====================================================

void test_fill_forward_leaves_strip_lit() {
    MockLedStrip strip(4);
    FillLedAnimation fill(strip, GREEN);
    fill.setStepDelay(1);

    TEST_ASSERT_TRUE(fill.start());

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(4, sets.size());
    assertSweep(sets, 0, FORWARD, 4, GREEN);

    TEST_ASSERT_EQUAL(0, strip.countCalls(MockLedStrip::CallType::Fill));
    TEST_ASSERT_TRUE(strip.allEqual(GREEN));
    TEST_ASSERT_EQUAL(0, g_warnings);
}

void test_fill_reverse_order() {
    MockLedStrip strip(4);
    FillLedAnimation fill(strip, GREEN, true);
    fill.setStepDelay(1);

    TEST_ASSERT_TRUE(fill.start(LedAnimation::NO_TIMEOUT, true));

    assertSweep(strip.setLedCalls(), 0, BACKWARD, 4, GREEN);
    TEST_ASSERT_TRUE(strip.allEqual(GREEN));
    TEST_ASSERT_EQUAL(0, g_warnings);
}

void test_fill_persistent_request_warns_and_runs_once() {
    MockLedStrip strip(4);
    FillLedAnimation fill(strip, GREEN);
    fill.setStepDelay(1);

    TEST_ASSERT_TRUE(fill.start(LedAnimation::NO_TIMEOUT, false));

    TEST_ASSERT_EQUAL(1, g_warnings);
    TEST_ASSERT_EQUAL(4, strip.setLedCalls().size());
    TEST_ASSERT_TRUE(strip.allEqual(GREEN));
}

void test_fill_timeout_request_warns() {
    MockLedStrip strip(3);
    FillLedAnimation fill(strip, GREEN);
    fill.setStepDelay(1);

    TEST_ASSERT_TRUE(fill.start(1000, true));

    TEST_ASSERT_EQUAL(1, g_warnings);
    TEST_ASSERT_EQUAL(3, strip.setLedCalls().size());
}

void test_fill_stop_interrupts_pass() {
    MockLedStrip strip(6);
    FillLedAnimation fill(strip, GREEN);
    fill.setStepDelay(2000);

    std::thread stopper([&fill] {
        platform_delay_ms(100);
        fill.stop();
    });
    uint32_t begin = platform_millis();
    TEST_ASSERT_TRUE(fill.start());
    uint32_t elapsed = platform_millis() - begin;
    stopper.join();

    TEST_ASSERT_LESS_THAN(1000, elapsed);
    TEST_ASSERT_EQUAL(1, strip.setLedCalls().size());
}

void test_fill_reuse_with_new_color_and_direction() {
    MockLedStrip strip(4);
    FillLedAnimation fill(strip, GREEN);
    fill.setStepDelay(1);
    TEST_ASSERT_TRUE(fill.start());

    strip.reset();
    fill.setFillColor(BLUE);
    fill.setReverse(true);
    TEST_ASSERT_TRUE(fill.start());

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(4, sets.size());
    assertSweep(sets, 0, BACKWARD, 4, BLUE);
    TEST_ASSERT_TRUE(strip.allEqual(BLUE));
}

// =====================================================
// Refill
// =====================================================

void test_refill_one_shot_fills_then_clears() {
    MockLedStrip strip(4);
    RefillLedAnimation refill(strip, GREEN);
    refill.setStepDelay(1);

    TEST_ASSERT_TRUE(refill.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(8, sets.size());
    assertSweep(sets, 0, FORWARD, 4, GREEN);
    assertSweep(sets, 4, FORWARD, 4, BLACK);

    // Composite ends with an off fill
    const MockLedStrip::Call& last = strip.calls.back();
    TEST_ASSERT_TRUE(last.type == MockLedStrip::CallType::Fill);
    TEST_ASSERT_TRUE(last.color == BLACK);
    TEST_ASSERT_TRUE(strip.allOff());
    TEST_ASSERT_EQUAL(0, g_warnings);
}

void test_refill_reverse_keeps_direction_for_both_passes() {
    MockLedStrip strip(4);
    RefillLedAnimation refill(strip, GREEN, true);
    refill.setStepDelay(1);

    TEST_ASSERT_TRUE(refill.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    assertSweep(sets, 0, BACKWARD, 4, GREEN);
    assertSweep(sets, 4, BACKWARD, 4, BLACK);
}

void test_refill_timeout_repeats_cycles() {
    MockLedStrip strip(3);
    RefillLedAnimation refill(strip, GREEN);
    refill.setStepDelay(1);

    TEST_ASSERT_TRUE(refill.start(100, false));

    // At least two full cycles of 6 writes each
    TEST_ASSERT_GREATER_OR_EQUAL(12, strip.setLedCalls().size());
    TEST_ASSERT_TRUE(strip.allOff());
}

// =====================================================
// Bounce
// =====================================================

void test_bounce_reverses_off_pass() {
    MockLedStrip strip(4);
    BounceLedAnimation bounce(strip, GREEN);
    bounce.setStepDelay(1);

    TEST_ASSERT_TRUE(bounce.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(8, sets.size());
    assertSweep(sets, 0, FORWARD, 4, GREEN);
    assertSweep(sets, 4, BACKWARD, 4, BLACK);
    TEST_ASSERT_TRUE(strip.allOff());
}

void test_bounce_reverse_starts_from_far_end() {
    MockLedStrip strip(4);
    BounceLedAnimation bounce(strip, GREEN, true);
    bounce.setStepDelay(1);

    TEST_ASSERT_TRUE(bounce.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    assertSweep(sets, 0, BACKWARD, 4, GREEN);
    assertSweep(sets, 4, FORWARD, 4, BLACK);
}

void test_bounce_second_run_starts_in_original_direction() {
    MockLedStrip strip(4);
    BounceLedAnimation bounce(strip, GREEN);
    bounce.setStepDelay(1);

    TEST_ASSERT_TRUE(bounce.start(30, false));
    TEST_ASSERT_TRUE(strip.allOff());

    strip.reset();
    TEST_ASSERT_TRUE(bounce.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(8, sets.size());
    assertSweep(sets, 0, FORWARD, 4, GREEN);
    assertSweep(sets, 4, BACKWARD, 4, BLACK);
}

void test_bounce_stop_returns_within_one_step() {
    MockLedStrip strip(8);
    BounceLedAnimation bounce(strip, GREEN);
    bounce.setStepDelay(2000);

    std::thread stopper([&bounce] {
        platform_delay_ms(100);
        bounce.stop();
    });
    uint32_t begin = platform_millis();
    TEST_ASSERT_TRUE(bounce.start(60000, false));
    uint32_t elapsed = platform_millis() - begin;
    stopper.join();

    TEST_ASSERT_LESS_THAN(1000, elapsed);
    TEST_ASSERT_EQUAL(1, strip.setLedCalls().size());
    TEST_ASSERT_TRUE(strip.allOff());
}

// =====================================================
// Composite Lifecycle
// =====================================================

void test_composite_reuse_with_new_color_and_direction() {
    MockLedStrip strip(4);
    RefillLedAnimation refill(strip, GREEN);
    refill.setStepDelay(1);
    TEST_ASSERT_TRUE(refill.start(LedAnimation::NO_TIMEOUT, true));

    strip.reset();
    refill.setFillColor(BLUE);
    refill.setReverse(true);
    TEST_ASSERT_TRUE(refill.start(LedAnimation::NO_TIMEOUT, true));

    std::vector<MockLedStrip::Call> sets = strip.setLedCalls();
    TEST_ASSERT_EQUAL(8, sets.size());
    assertSweep(sets, 0, BACKWARD, 4, BLUE);
    assertSweep(sets, 4, BACKWARD, 4, BLACK);
    TEST_ASSERT_TRUE(strip.allOff());
}

void test_composite_stop_reaches_inner_fill() {
    MockLedStrip strip(8);
    RefillLedAnimation refill(strip, GREEN);
    refill.setStepDelay(2000);

    std::thread stopper([&refill] {
        platform_delay_ms(100);
        refill.stop();
    });
    uint32_t begin = platform_millis();
    TEST_ASSERT_TRUE(refill.start(60000, false));
    uint32_t elapsed = platform_millis() - begin;
    stopper.join();

    TEST_ASSERT_LESS_THAN(1000, elapsed);
    TEST_ASSERT_EQUAL(1, strip.setLedCalls().size());
    TEST_ASSERT_TRUE(strip.allOff());
    TEST_ASSERT_FALSE(refill.isRunning());
}

void test_composite_stop_before_start_is_cleared() {
    MockLedStrip strip(4);
    BounceLedAnimation bounce(strip, GREEN);
    bounce.setStepDelay(1);

    bounce.stop();
    TEST_ASSERT_TRUE(bounce.start(LedAnimation::NO_TIMEOUT, true));

    TEST_ASSERT_EQUAL(8, strip.setLedCalls().size());
}

void test_composite_device_failure_skips_off_fill() {
    MockLedStrip strip(4);
    RefillLedAnimation refill(strip, GREEN);
    refill.setStepDelay(1);
    strip.failAfterCalls = 2;

    TEST_ASSERT_FALSE(refill.start(LedAnimation::NO_TIMEOUT, true));

    TEST_ASSERT_EQUAL(2, strip.calls.size());
    TEST_ASSERT_EQUAL(0, strip.countCalls(MockLedStrip::CallType::Fill));
    TEST_ASSERT_EQUAL(1, strip.failedCalls);
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_fill_forward_leaves_strip_lit);
    RUN_TEST(test_fill_reverse_order);
    RUN_TEST(test_fill_persistent_request_warns_and_runs_once);
    RUN_TEST(test_fill_timeout_request_warns);
    RUN_TEST(test_fill_stop_interrupts_pass);
    RUN_TEST(test_fill_reuse_with_new_color_and_direction);
    RUN_TEST(test_refill_one_shot_fills_then_clears);
    RUN_TEST(test_refill_reverse_keeps_direction_for_both_passes);
    RUN_TEST(test_refill_timeout_repeats_cycles);
    RUN_TEST(test_bounce_reverses_off_pass);
    RUN_TEST(test_bounce_reverse_starts_from_far_end);
    RUN_TEST(test_bounce_second_run_starts_in_original_direction);
    RUN_TEST(test_bounce_stop_returns_within_one_step);
    RUN_TEST(test_composite_reuse_with_new_color_and_direction);
    RUN_TEST(test_composite_stop_reaches_inner_fill);
    RUN_TEST(test_composite_stop_before_start_is_cleared);
    RUN_TEST(test_composite_device_failure_skips_off_fill);

    return UNITY_END();
}
