#include <string.h>
#include <unity.h>
#include "errors.h"
#include "test_errors.h"

static void test_errors_empty(void)
{
  TEST_ASSERT_EQUAL(0, errorCount());
  TEST_ASSERT_EQUAL(ERR_NONE, getNextError());
}

static void test_errors_set(void)
{
  TEST_ASSERT_EQUAL(0, setError(ERR_CAM_EDGE_ORDER));
  TEST_ASSERT_EQUAL(1, setError(ERR_TDC_OUT_OF_RANGE));
  TEST_ASSERT_EQUAL(2, errorCount());

  //Already active, stays in its slot
  TEST_ASSERT_EQUAL(0, setError(ERR_CAM_EDGE_ORDER));
  TEST_ASSERT_EQUAL(2, errorCount());

  TEST_ASSERT_EQUAL(MAX_ERRORS, setError(ERR_NONE));
  TEST_ASSERT_EQUAL(2, errorCount());
}

static void test_errors_full(void)
{
  TEST_ASSERT_EQUAL(0, setError(ERR_INVALID_CYL_COUNT));
  TEST_ASSERT_EQUAL(1, setError(ERR_TDC_OUT_OF_RANGE));
  TEST_ASSERT_EQUAL(2, setError(ERR_CAM_EDGE_COUNT));
  TEST_ASSERT_EQUAL(3, setError(ERR_CAM_EDGE_ORDER));
  TEST_ASSERT_EQUAL(MAX_ERRORS, setError(ERR_CRANK_WHEEL));
  TEST_ASSERT_EQUAL(MAX_ERRORS, errorCount());
}

static void test_errors_next_cycles(void)
{
  setError(ERR_INVALID_CYL_COUNT);
  setError(ERR_REGISTRY_FULL);
  setError(ERR_ENGINE_NAME);

  TEST_ASSERT_EQUAL(ERR_INVALID_CYL_COUNT, getNextError());
  TEST_ASSERT_EQUAL(ERR_REGISTRY_FULL, getNextError());
  TEST_ASSERT_EQUAL(ERR_ENGINE_NAME, getNextError());
  TEST_ASSERT_EQUAL(ERR_INVALID_CYL_COUNT, getNextError());
}

static void test_errors_clear(void)
{
  setError(ERR_INVALID_CYL_COUNT);
  setError(ERR_REGISTRY_FULL);
  setError(ERR_ENGINE_NAME);

  clearError(ERR_REGISTRY_FULL);
  TEST_ASSERT_EQUAL(2, errorCount());
  TEST_ASSERT_EQUAL(ERR_INVALID_CYL_COUNT, getNextError());
  TEST_ASSERT_EQUAL(ERR_ENGINE_NAME, getNextError());

  //Clearing an error that is not active does nothing
  clearError(ERR_CRANK_WHEEL);
  TEST_ASSERT_EQUAL(2, errorCount());

  clearError(ERR_INVALID_CYL_COUNT);
  clearError(ERR_ENGINE_NAME);
  TEST_ASSERT_EQUAL(0, errorCount());
  TEST_ASSERT_EQUAL(ERR_NONE, getNextError());

  //Freed slots are reused
  TEST_ASSERT_EQUAL(0, setError(ERR_CRANK_WHEEL));
}

static void test_errors_clear_all(void)
{
  setError(ERR_INVALID_CYL_COUNT);
  setError(ERR_REGISTRY_FULL);
  clearAllErrors();
  TEST_ASSERT_EQUAL(0, errorCount());
  TEST_ASSERT_EQUAL(ERR_NONE, getNextError());
}

static void test_errors_names(void)
{
  TEST_ASSERT_EQUAL_STRING("none", errorName(ERR_NONE));
  TEST_ASSERT_EQUAL_STRING("invalid cylinder count", errorName(ERR_INVALID_CYL_COUNT));
  TEST_ASSERT_EQUAL_STRING("unknown error", errorName(200));

  for(uint8_t code = ERR_INVALID_CYL_COUNT; code <= ERR_ENGINE_NAME; code++)
  {
    TEST_ASSERT_TRUE(strcmp("unknown error", errorName(code)) != 0);
  }
}

void testErrors(void)
{
  RUN_TEST(test_errors_empty);
  RUN_TEST(test_errors_set);
  RUN_TEST(test_errors_full);
  RUN_TEST(test_errors_next_cycles);
  RUN_TEST(test_errors_clear);
  RUN_TEST(test_errors_clear_all);
  RUN_TEST(test_errors_names);
}
