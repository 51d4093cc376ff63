#include <unity.h>
#include "timing.h"
#include "test_timing.h"

static void test_timing_sample_period(void)
{
  TEST_ASSERT_EQUAL_UINT32(16667UL, samplePeriodNs(1000));
  TEST_ASSERT_EQUAL_UINT32(2778UL, samplePeriodNs(6000));
  TEST_ASSERT_EQUAL_UINT32(16666667UL, samplePeriodNs(1));
}

static void test_timing_timer_ticks(void)
{
  TEST_ASSERT_EQUAL_UINT32(17UL, timerTicksPerSample(1000, 1000000UL));
  TEST_ASSERT_EQUAL_UINT32(1333UL, timerTicksPerSample(1000, 80000000UL));
  //Timer too slow for the speed, runs at one tick per element
  TEST_ASSERT_EQUAL_UINT32(1UL, timerTicksPerSample(1000, 1000UL));
}

static void test_timing_cycle_time(void)
{
  TEST_ASSERT_EQUAL_UINT32(120000UL, cycleTimeUs(1000));
  TEST_ASSERT_EQUAL_UINT32(20000UL, cycleTimeUs(6000));
  TEST_ASSERT_EQUAL_UINT32(17142857UL, cycleTimeUs(7));
}

static void test_timing_stopped_engine(void)
{
  TEST_ASSERT_EQUAL_UINT32(0, samplePeriodNs(0));
  TEST_ASSERT_EQUAL_UINT32(0, timerTicksPerSample(0, 1000000UL));
  TEST_ASSERT_EQUAL_UINT32(0, timerTicksPerSample(1000, 0));
  TEST_ASSERT_EQUAL_UINT32(0, cycleTimeUs(0));
}

void testTiming(void)
{
  RUN_TEST(test_timing_sample_period);
  RUN_TEST(test_timing_timer_ticks);
  RUN_TEST(test_timing_cycle_time);
  RUN_TEST(test_timing_stopped_engine);
}
