/** \file pulsetrain.h
 * @brief Pulse train generation
 *
 * Generates, from an engine configuration, the pulse train for direct writing on a GPIO port as a bit mask.
 * Each element of the pulse train is the crank, cam and TDC state at one position (the array index, in 0.1 degree) of the
 * engine cycle. See globals.h for the bit layout.
 *
 * When generated, the pulse train has to be applied on the output pins with strict timing, either from a timer interrupt
 * writing one element per tick, or from a circular DMA triggered by a timer. In both cases the output restarts at element 0
 * after the last one, and only the timer period changes with engine speed (see timing.h).
 */
#ifndef PULSETRAIN_H
#define PULSETRAIN_H
#include "globals.h"
#include "errors.h"
#include "engbit.h"
#include "wheels.h"
#include "tdc.h"
#include "config.h"

/**
 * @brief Set the TDC marker of every cylinder
 *
 * Each marker is a single element wide. The TDC bits are only ever set here, so this has to run on a pulse train with
 * cleared TDC bits (which generatePulseTrain() provides).
 */
template<typename T>
void placeTdcMarkers(const engineConfig_t &cfg, T (&pt)[PULSE_TRAIN_LEN])
{
  for(uint8_t cyl = 0; (cyl < cfg.nCylinders) && (cyl < TDC_MAX_CYL); cyl++)
  {
    EngBit<T>::setTdc(pt[tdcPosition(cfg.refToTdc0, cfg.nCylinders, cyl)], cyl, LEVEL_HIGH);
  }
}

/**
 * @brief Generate the pulse train of an engine
 *
 * Single pass over the whole cycle writing the cam and crank levels of every element, then the TDC markers.
 * A transition at angle X is visible from element X+1 on: the element at X still holds the level reached before X.
 * Bits above the TDC bits (16 and 32 bit elements) are left as they are.
 *
 * No allocation, no I/O, constant execution time. cfg must have passed validateEngineConfig().
 *
 * @param pt Output, pulse train. Must not be used by anyone else during the call
 */
template<typename T>
void generatePulseTrain(const engineConfig_t &cfg, T (&pt)[PULSE_TRAIN_LEN])
{
  camState_t camState;
  crankState_t crankState;

  camStateInit(camState, cfg.cam);
  crankStateInit(crankState, cfg.crank);

  for(uint16_t angle = 0; angle < PULSE_TRAIN_LEN; angle++)
  {
    T val = pt[angle];
    val &= (T)~EngBit<T>::TDC_ALL_MSK;

    EngBit<T>::setCam(val, camState.level);
    camStateStep(camState, angle);

    EngBit<T>::setCrk(val, crankState.level);
    crankStateStep(crankState, angle);

    pt[angle] = val;
  }

  placeTdcMarkers(cfg, pt);
}

/**
 * @brief Validate the configuration then generate the pulse train
 *
 * @return ERR_NONE, or the validation error. The pulse train is left untouched on error
 */
template<typename T>
uint8_t generatePulseTrainChecked(const engineConfig_t &cfg, T (&pt)[PULSE_TRAIN_LEN])
{
  uint8_t result = validateEngineConfig(cfg);
  if(result == ERR_NONE) { generatePulseTrain(cfg, pt); }
  return result;
}

/** @name Pulse train fingerprint
 * CRC32 of the pulse train as it sits in memory (ie as the DMA sees it).
 */
///@{
uint32_t pulseTrainCRC32(const uint8_t (&pt)[PULSE_TRAIN_LEN]);
uint32_t pulseTrainCRC32(const uint16_t (&pt)[PULSE_TRAIN_LEN]);
uint32_t pulseTrainCRC32(const uint32_t (&pt)[PULSE_TRAIN_LEN]);
///@}

#endif
