/** \file config.h
 * @brief Engine configuration
 *
 * An engine configuration gathers everything the pulse train generator needs: the two wheels, where the first TDC sits
 * and how many cylinders share the cycle. It is built and validated once, the generator only ever reads it.
 */
#ifndef CONFIG_H
#define CONFIG_H
#include "globals.h"
#include "wheels.h"

struct engineConfig_t {
  camWheel_t   cam;         //Camshaft wheel configuration
  crankWheel_t crank;       //Crankshaft wheel configuration
  int16_t      refToTdc0;   //Angle from the reference (crank gap) to the first TDC, DEG_S16_DEC1. Wrapped into the cycle
  uint8_t      nCylinders;  //Number of cylinders, used for TDC generation
};

/**
 * @brief Check every part of an engine configuration
 *
 * Checks are done wheel first (crank then cam), then cylinder count and TDC placement.
 *
 * @return ERR_NONE or the first error found
 */
uint8_t validateEngineConfig(const engineConfig_t &cfg);

/** Fill and validate an engine configuration */
uint8_t engineConfigSetup(engineConfig_t &cfg, const crankWheel_t &crank, const camWheel_t &cam, int16_t refToTdc0, uint8_t nCylinders);

class EngineRegistryClass;

/**
 * @brief Register the built-in engines
 *
 * - "V6 60-2": 60-2 crank wheel with the gap held HIGH, 20 edge cam, 6 cylinders, first TDC 65.8 degrees after the gap
 * - "I4 60-2": 60-2 crank wheel, single tooth cam, 4 cylinders, first TDC 114 degrees after the gap
 *
 * @return ERR_NONE or the first registration error
 */
uint8_t loadDefaultEngines(EngineRegistryClass &registry);

#endif // CONFIG_H
