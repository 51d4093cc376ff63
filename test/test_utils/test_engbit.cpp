#include <unity.h>
#include "engbit.h"
#include "test_engbit.h"

static void test_engbit_masks(void)
{
  TEST_ASSERT_EQUAL_HEX8(0x01, EngBit<uint8_t>::CAM_MSK);
  TEST_ASSERT_EQUAL_HEX8(0x02, EngBit<uint8_t>::CRK_MSK);
  TEST_ASSERT_EQUAL_HEX8(0x04, EngBit<uint8_t>::tdcMask(0));
  TEST_ASSERT_EQUAL_HEX8(0x80, EngBit<uint8_t>::tdcMask(5));
  TEST_ASSERT_EQUAL_HEX8(0x00, EngBit<uint8_t>::tdcMask(6));
  TEST_ASSERT_EQUAL_HEX8(0xFC, EngBit<uint8_t>::TDC_ALL_MSK);

  //Same layout whatever the element width
  TEST_ASSERT_EQUAL_HEX16(0x0002, EngBit<uint16_t>::CRK_MSK);
  TEST_ASSERT_EQUAL_HEX16(0x00FC, EngBit<uint16_t>::TDC_ALL_MSK);
  TEST_ASSERT_EQUAL_HEX32(0x00000010UL, EngBit<uint32_t>::tdcMask(2));
  TEST_ASSERT_EQUAL_HEX32(0x000000FCUL, EngBit<uint32_t>::TDC_ALL_MSK);
}

static void test_engbit_cam_crank(void)
{
  uint8_t val = 0;

  EngBit<uint8_t>::setCam(val, LEVEL_HIGH);
  TEST_ASSERT_EQUAL_HEX8(0x01, val);
  TEST_ASSERT_EQUAL(LEVEL_HIGH, EngBit<uint8_t>::getCam(val));
  TEST_ASSERT_EQUAL(LEVEL_LOW, EngBit<uint8_t>::getCrk(val));

  EngBit<uint8_t>::setCrk(val, LEVEL_HIGH);
  TEST_ASSERT_EQUAL_HEX8(0x03, val);
  EngBit<uint8_t>::setCam(val, LEVEL_LOW);
  TEST_ASSERT_EQUAL_HEX8(0x02, val);
  TEST_ASSERT_EQUAL(LEVEL_LOW, EngBit<uint8_t>::getCam(val));
  TEST_ASSERT_EQUAL(LEVEL_HIGH, EngBit<uint8_t>::getCrk(val));
}

static void test_engbit_tdc(void)
{
  uint8_t val = 0;

  for(uint8_t cyl = 0; cyl < TDC_MAX_CYL; cyl++)
  {
    EngBit<uint8_t>::setTdc(val, cyl, LEVEL_HIGH);
    TEST_ASSERT_EQUAL(LEVEL_HIGH, EngBit<uint8_t>::getTdc(val, cyl));
  }
  TEST_ASSERT_EQUAL_HEX8(0xFC, val);

  EngBit<uint8_t>::setTdc(val, 3, LEVEL_LOW);
  TEST_ASSERT_EQUAL_HEX8(0xDC, val);
  TEST_ASSERT_EQUAL(LEVEL_LOW, EngBit<uint8_t>::getTdc(val, 3));
}

static void test_engbit_tdc_out_of_range(void)
{
  uint8_t val = 0xFF;

  TEST_ASSERT_EQUAL(LEVEL_LOW, EngBit<uint8_t>::getTdc(val, 6));
  EngBit<uint8_t>::setTdc(val, 6, LEVEL_LOW);
  TEST_ASSERT_EQUAL_HEX8(0xFF, val);

  val = 0;
  EngBit<uint8_t>::setTdc(val, 200, LEVEL_HIGH);
  TEST_ASSERT_EQUAL_HEX8(0x00, val);
}

static void test_engbit_wide_elements(void)
{
  uint16_t val16 = 0xFF00U;
  uint32_t val32 = 0xDEAD0000UL;

  EngBit<uint16_t>::setCam(val16, LEVEL_HIGH);
  EngBit<uint16_t>::setTdc(val16, 5, LEVEL_HIGH);
  TEST_ASSERT_EQUAL_HEX16(0xFF81U, val16);
  EngBit<uint16_t>::setCam(val16, LEVEL_LOW);
  TEST_ASSERT_EQUAL_HEX16(0xFF80U, val16);

  EngBit<uint32_t>::setCrk(val32, LEVEL_HIGH);
  EngBit<uint32_t>::setTdc(val32, 0, LEVEL_HIGH);
  TEST_ASSERT_EQUAL_HEX32(0xDEAD0006UL, val32);
  TEST_ASSERT_EQUAL(LEVEL_HIGH, EngBit<uint32_t>::getCrk(val32));
  TEST_ASSERT_EQUAL(LEVEL_LOW, EngBit<uint32_t>::getCam(val32));
}

static void test_engbit_invert_level(void)
{
  TEST_ASSERT_EQUAL(LEVEL_HIGH, invertLevel(LEVEL_LOW));
  TEST_ASSERT_EQUAL(LEVEL_LOW, invertLevel(LEVEL_HIGH));
}

void testEngBit(void)
{
  RUN_TEST(test_engbit_masks);
  RUN_TEST(test_engbit_cam_crank);
  RUN_TEST(test_engbit_tdc);
  RUN_TEST(test_engbit_tdc_out_of_range);
  RUN_TEST(test_engbit_wide_elements);
  RUN_TEST(test_engbit_invert_level);
}
