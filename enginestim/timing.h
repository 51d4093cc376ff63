/** \file timing.h
 * @brief Output timing of a pulse train
 *
 * A pulse train element covers 0.1 crank degree, so the rate at which elements have to be written to the port is
 * proportional to engine speed. These helpers give the period to program in the timer driving the output.
 * An RPM of 0 means the engine is stopped and every helper returns 0.
 */
#ifndef TIMING_H
#define TIMING_H
#include "globals.h"

/** Time per pulse train element, in nS (rounded) */
uint32_t samplePeriodNs(uint16_t rpm);

/** Time per pulse train element, in ticks of a timer running at timerHz (rounded, at least 1) */
uint32_t timerTicksPerSample(uint16_t rpm, uint32_t timerHz);

/** Duration of a whole engine cycle (720 degrees), in uS (rounded) */
uint32_t cycleTimeUs(uint16_t rpm);

#endif
