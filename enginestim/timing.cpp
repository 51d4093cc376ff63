/** @file
 * Output timing of a pulse train.
 */
#include "timing.h"

#define SECS_PER_MIN  60U

static uint64_t roundedDiv(uint64_t num, uint64_t den)
{
  return (num + (den >> 1)) / den;
}

uint32_t samplePeriodNs(uint16_t rpm)
{
  if(rpm == 0U) { return 0U; }
  return (uint32_t)roundedDiv(NANOS_PER_SEC * SECS_PER_MIN, (uint64_t)ANGLE_UNITS_PER_REV * rpm);
}

uint32_t timerTicksPerSample(uint16_t rpm, uint32_t timerHz)
{
  if( (rpm == 0U) || (timerHz == 0U) ) { return 0U; }

  uint64_t ticks = roundedDiv((uint64_t)timerHz * SECS_PER_MIN, (uint64_t)ANGLE_UNITS_PER_REV * rpm);
  if(ticks == 0U) { ticks = 1U; } //Timer cannot keep up, run it as fast as possible
  if(ticks > UINT32_MAX) { ticks = UINT32_MAX; }

  return (uint32_t)ticks;
}

uint32_t cycleTimeUs(uint16_t rpm)
{
  if(rpm == 0U) { return 0U; }
  //Two revolutions per cycle
  return (uint32_t)roundedDiv((uint64_t)MICROS_PER_MIN * 2U, rpm);
}
