#ifndef WHEEL_MISSING_TOOTH_H
#define WHEEL_MISSING_TOOTH_H

#include <libdivide.h>

uint8_t crankWheelSetup(crankWheel_t &wheel, uint8_t toothCount, uint8_t missingTeeth, bool gapInverted);
uint8_t crankWheelFromPreset(crankWheel_t &wheel, uint8_t preset);
uint8_t validateCrankWheel(const crankWheel_t &wheel);

/** Angle units from one tooth to the next */
uint16_t crankToothAngle(const crankWheel_t &wheel);
/** Angle units covered by the gap */
uint16_t crankGapSpan(const crankWheel_t &wheel);
/** Level seen when starting a rotation from angle 0 */
Level crankFirstLevel(const crankWheel_t &wheel);
/** Level the signal is held at for the whole gap */
Level crankGapLevel(const crankWheel_t &wheel);
/** Whether angle (0 to PULSE_TRAIN_LEN-1) lies in the gap window at the end of its revolution */
bool crankInGapWindow(const crankWheel_t &wheel, uint16_t angle);

/** Crank signal tracker used by the pulse train generator */
struct crankState_t {
  Level    level;
  Level    gapLevel;
  uint16_t halfTooth;   //Level changes happen every half tooth
  uint16_t gapStart;    //Angle (within one revolution) at which the gap window opens
  libdivide::libdivide_u16_t divHalfTooth;
};

void crankStateInit(crankState_t &state, const crankWheel_t &wheel);

/** Apply the transition rule for `angle`. Must be called after the level for `angle` has been written. */
static inline void crankStateStep(crankState_t &state, uint16_t angle)
{
  if(angle == 0U) { return; }

  uint16_t halfTeeth = libdivide::libdivide_u16_do(angle, &state.divHalfTooth);
  if( (uint16_t)(halfTeeth * state.halfTooth) == angle )
  {
    uint16_t revAngle = (angle >= ANGLE_UNITS_PER_REV) ? (uint16_t)(angle - ANGLE_UNITS_PER_REV) : angle;
    if(revAngle >= state.gapStart) { state.level = state.gapLevel; } //Hold the gap level, regardless of how many half teeth are crossed
    else { state.level = invertLevel(state.level); }
  }
}

#endif
