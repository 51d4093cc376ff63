/** \file toothlog.h
 * @brief Composite log of a pulse train
 *
 * Lists the signal changes of a pulse train the way a composite trigger logger would capture them from the output pins:
 * one entry per element where any of the signals changed, with the angle and the state of all signals after the change.
 * Used by the diagnostics output and to check generated patterns.
 */
#ifndef TOOTHLOG_H
#define TOOTHLOG_H
#include "globals.h"
#include "engbit.h"

#define TOOTH_LOG_SIZE      512U

//Bits of the composite state byte
#define COMPOSITE_LOG_CAM   0
#define COMPOSITE_LOG_CRK   1
#define COMPOSITE_LOG_TDC   2 //Any TDC marker is HIGH
#define COMPOSITE_LOG_CYL0  3 //Cylinder 1 TDC marker, ie the start of the firing order

struct compositeLogEntry_t {
  uint16_t angle;
  uint8_t  state;
};

struct compositeLog_t {
  compositeLogEntry_t entries[TOOTH_LOG_SIZE];
  uint16_t count;
  bool     overflowed;  //More changes than TOOTH_LOG_SIZE were seen, the last ones are missing
};

void compositeLogReset(compositeLog_t &log);
void compositeLogAdd(compositeLog_t &log, uint16_t angle, uint8_t state);

/** Composite state byte of one pulse train element */
template<typename T>
uint8_t compositeState(T val)
{
  uint8_t state = 0;
  if(EngBit<T>::getCam(val) == LEVEL_HIGH) { BIT_SET(state, COMPOSITE_LOG_CAM); }
  if(EngBit<T>::getCrk(val) == LEVEL_HIGH) { BIT_SET(state, COMPOSITE_LOG_CRK); }
  if((val & EngBit<T>::TDC_ALL_MSK) != 0U) { BIT_SET(state, COMPOSITE_LOG_TDC); }
  if(EngBit<T>::getTdc(val, 0) == LEVEL_HIGH) { BIT_SET(state, COMPOSITE_LOG_CYL0); }
  return state;
}

/**
 * @brief Build the composite log of a pulse train
 *
 * The first entry is always the state at angle 0, the following ones each change of state.
 */
template<typename T>
void buildCompositeLog(const T (&pt)[PULSE_TRAIN_LEN], compositeLog_t &log)
{
  compositeLogReset(log);

  uint8_t lastState = compositeState(pt[0]);
  compositeLogAdd(log, 0, lastState);

  for(uint16_t angle = 1; angle < PULSE_TRAIN_LEN; angle++)
  {
    uint8_t state = compositeState(pt[angle]);
    if(state != lastState)
    {
      compositeLogAdd(log, angle, state);
      lastState = state;
    }
  }
}

/** Number of level changes of one signal over the cycle, including the change when wrapping from the last element to the first */
template<typename T>
uint16_t countSignalEdges(const T (&pt)[PULSE_TRAIN_LEN], uint8_t compositeBit)
{
  uint16_t edges = 0;
  bool last = BIT_CHECK(compositeState(pt[PULSE_TRAIN_LEN - 1U]), compositeBit);

  for(uint16_t angle = 0; angle < PULSE_TRAIN_LEN; angle++)
  {
    bool current = BIT_CHECK(compositeState(pt[angle]), compositeBit);
    if(current != last) { edges++; }
    last = current;
  }
  return edges;
}

#endif
