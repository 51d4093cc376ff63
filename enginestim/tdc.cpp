/** @file
 * TDC placement.
 */
#include "tdc.h"
#include "errors.h"

bool isSupportedCylinderCount(uint8_t nCylinders)
{
  //Only symmetrical 4 and 6 cylinder engines. More than TDC_MAX_CYL would not fit in the pulse train element
  if( (nCylinders != 4U) && (nCylinders != 6U) ) { return false; }
  return ((PULSE_TRAIN_LEN % nCylinders) == 0U);
}

uint16_t tdcInterval(uint8_t nCylinders)
{
  if(isSupportedCylinderCount(nCylinders) == false) { return 0U; }
  return (uint16_t)(PULSE_TRAIN_LEN / nCylinders);
}

uint16_t wrapAngle(int32_t angle)
{
  int32_t wrapped = angle % (int32_t)PULSE_TRAIN_LEN;
  if(wrapped < 0) { wrapped += (int32_t)PULSE_TRAIN_LEN; }
  return (uint16_t)wrapped;
}

uint16_t tdcPosition(int16_t refToTdc0, uint8_t nCylinders, uint8_t cyl)
{
  return wrapAngle((int32_t)refToTdc0 + ((int32_t)cyl * tdcInterval(nCylinders)));
}

uint8_t calculateTdcPositions(int16_t refToTdc0, uint8_t nCylinders, uint16_t (&positions)[TDC_MAX_CYL])
{
  if(isSupportedCylinderCount(nCylinders) == false) { return ERR_INVALID_CYL_COUNT; }

  for(uint8_t cyl = 0; cyl < nCylinders; cyl++)
  {
    positions[cyl] = tdcPosition(refToTdc0, nCylinders, cyl);

    //Wrapped positions of the supported counts are always in range and distinct
    if(positions[cyl] >= PULSE_TRAIN_LEN) { return ERR_TDC_OUT_OF_RANGE; }
    for(uint8_t other = 0; other < cyl; other++)
    {
      if(positions[other] == positions[cyl]) { return ERR_TDC_OUT_OF_RANGE; }
    }
  }
  return ERR_NONE;
}
