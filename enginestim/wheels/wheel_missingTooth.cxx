/** A (single) multi-tooth crank wheel with one or more 'missing' teeth.
* Angle 0 is the end of the gap, ie the first tooth after the missing one.
* The signal toggles every half tooth and is held at the gap level over the last missingTeeth tooth pitches of each revolution.
* @defgroup wheel_miss Missing tooth wheel
* @{
*/
struct crankPreset_t {
  uint8_t toothCount;
  uint8_t missingTeeth;
  bool    gapInverted;
};

static const crankPreset_t crankPresets[CRANK_WHEEL_PRESETS] = {
  { 30U,  1U, false }, //CRANK_WHEEL_30_1
  { 30U,  2U, false }, //CRANK_WHEEL_30_2
  { 60U,  1U, false }, //CRANK_WHEEL_60_1
  { 60U,  2U, false }, //CRANK_WHEEL_60_2
  { 120U, 1U, false }, //CRANK_WHEEL_120_1
  { 120U, 2U, false }, //CRANK_WHEEL_120_2
  { 30U,  1U, true },  //CRANK_WHEEL_30_1_INV
  { 30U,  2U, true },  //CRANK_WHEEL_30_2_INV
  { 60U,  1U, true },  //CRANK_WHEEL_60_1_INV
  { 60U,  2U, true },  //CRANK_WHEEL_60_2_INV
  { 120U, 1U, true },  //CRANK_WHEEL_120_1_INV
  { 120U, 2U, true },  //CRANK_WHEEL_120_2_INV
};

uint8_t validateCrankWheel(const crankWheel_t &wheel)
{
  if( (wheel.toothCount != 30U) && (wheel.toothCount != 60U) && (wheel.toothCount != 120U) ) { return ERR_CRANK_WHEEL; }
  if( (wheel.missingTeeth != 1U) && (wheel.missingTeeth != 2U) ) { return ERR_CRANK_WHEEL; }

  //The generator works in half teeth, so the tooth angle has to be even and fit a whole number of times in a revolution
  uint16_t toothAngle = crankToothAngle(wheel);
  if( ((ANGLE_UNITS_PER_REV % wheel.toothCount) != 0U) || ((toothAngle & 1U) != 0U) ) { return ERR_CRANK_WHEEL; }

  return ERR_NONE;
}

uint8_t crankWheelSetup(crankWheel_t &wheel, uint8_t toothCount, uint8_t missingTeeth, bool gapInverted)
{
  wheel.toothCount = toothCount;
  wheel.missingTeeth = missingTeeth;
  wheel.gapInverted = gapInverted;
  return validateCrankWheel(wheel);
}

uint8_t crankWheelFromPreset(crankWheel_t &wheel, uint8_t preset)
{
  if(preset >= CRANK_WHEEL_PRESETS) { return ERR_CRANK_WHEEL; }
  return crankWheelSetup(wheel, crankPresets[preset].toothCount, crankPresets[preset].missingTeeth, crankPresets[preset].gapInverted);
}

uint16_t crankToothAngle(const crankWheel_t &wheel)
{
  if(wheel.toothCount == 0U) { return 0U; }
  return (uint16_t)(ANGLE_UNITS_PER_REV / wheel.toothCount);
}

uint16_t crankGapSpan(const crankWheel_t &wheel)
{
  return (uint16_t)(wheel.missingTeeth * crankToothAngle(wheel));
}

Level crankFirstLevel(const crankWheel_t &wheel)
{
  return wheel.gapInverted ? LEVEL_LOW : LEVEL_HIGH;
}

Level crankGapLevel(const crankWheel_t &wheel)
{
  return invertLevel(crankFirstLevel(wheel));
}

bool crankInGapWindow(const crankWheel_t &wheel, uint16_t angle)
{
  return (angle % ANGLE_UNITS_PER_REV) >= (ANGLE_UNITS_PER_REV - crankGapSpan(wheel));
}

void crankStateInit(crankState_t &state, const crankWheel_t &wheel)
{
  state.level = crankFirstLevel(wheel);
  state.gapLevel = crankGapLevel(wheel);
  state.halfTooth = crankToothAngle(wheel) >> 1;
  state.gapStart = (uint16_t)(ANGLE_UNITS_PER_REV - crankGapSpan(wheel));
  state.divHalfTooth = libdivide::libdivide_u16_gen(state.halfTooth);
}
/** @} */
