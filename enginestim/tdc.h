/** \file tdc.h
 * @brief Top-Dead-Center marker placement
 *
 * TDCs are spread evenly over the engine cycle, starting from the first cylinder's TDC which sits refToTdc0 angle units
 * after the first crank gap. Positions always wrap around the end of the pulse train.
 */
#ifndef TDC_H
#define TDC_H
#include "globals.h"

bool isSupportedCylinderCount(uint8_t nCylinders);

/** Angle units between two consecutive TDCs. 0 for unsupported cylinder counts. */
uint16_t tdcInterval(uint8_t nCylinders);

/** Bring any angle back into [0, PULSE_TRAIN_LEN) */
uint16_t wrapAngle(int32_t angle);

/** TDC position of cylinder cyl (0 based), wrapped into the pulse train */
uint16_t tdcPosition(int16_t refToTdc0, uint8_t nCylinders, uint8_t cyl);

/**
 * @brief Compute the TDC position of every cylinder
 *
 * @param positions Output, entries 0 to nCylinders-1 are filled in
 * @return ERR_NONE, ERR_INVALID_CYL_COUNT or ERR_TDC_OUT_OF_RANGE
 */
uint8_t calculateTdcPositions(int16_t refToTdc0, uint8_t nCylinders, uint16_t (&positions)[TDC_MAX_CYL]);

#endif
