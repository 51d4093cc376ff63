/** @file
 * Engine configuration validation and the built-in engine table.
 */

#include "globals.h"
#include "errors.h"
#include "config.h"
#include "tdc.h"
#include "registry.h"


static const int16_t v6CamEdges[] = {
  289, 389, 1189, 1289, 1489, 1589, 2089, 2189, 2689, 2789,
  3889, 3989, 5089, 5189, 5689, 5789, 6289, 6389, 6589, 6689
};

static const int16_t i4CamEdges[] = { 600, 1200 };


uint8_t validateEngineConfig(const engineConfig_t &cfg)
{
  uint8_t result = validateCrankWheel(cfg.crank);
  if(result != ERR_NONE) { return result; }

  result = validateCamWheel(cfg.cam);
  if(result != ERR_NONE) { return result; }

  uint16_t positions[TDC_MAX_CYL];
  return calculateTdcPositions(cfg.refToTdc0, cfg.nCylinders, positions);
}

uint8_t engineConfigSetup(engineConfig_t &cfg, const crankWheel_t &crank, const camWheel_t &cam, int16_t refToTdc0, uint8_t nCylinders)
{
  cfg.crank = crank;
  cfg.cam = cam;
  cfg.refToTdc0 = refToTdc0;
  cfg.nCylinders = nCylinders;
  return validateEngineConfig(cfg);
}

/** Build one of the built-in engines and hand it to the registry */
static uint8_t loadEngine(EngineRegistryClass &registry, const char *name, uint8_t crankPreset, Level camFirstLevel, const int16_t *camEdges, uint8_t camEdgeCount, int16_t refToTdc0, uint8_t nCylinders)
{
  crankWheel_t crank;
  camWheel_t cam;
  engineConfig_t cfg;

  uint8_t result = crankWheelFromPreset(crank, crankPreset);
  if(result == ERR_NONE) { result = camWheelSetup(cam, camFirstLevel, camEdges, camEdgeCount); }
  if(result == ERR_NONE) { result = engineConfigSetup(cfg, crank, cam, refToTdc0, nCylinders); }
  if(result == ERR_NONE) { result = registry.registerEngine(name, cfg); }
  else { setError(result); }

  return result;
}

uint8_t loadDefaultEngines(EngineRegistryClass &registry)
{
  uint8_t result = loadEngine(registry, "V6 60-2", CRANK_WHEEL_60_2_INV, LEVEL_HIGH, v6CamEdges, sizeof(v6CamEdges) / sizeof(v6CamEdges[0]), 658, 6U);
  if(result != ERR_NONE) { return result; }

  return loadEngine(registry, "I4 60-2", CRANK_WHEEL_60_2, LEVEL_LOW, i4CamEdges, sizeof(i4CamEdges) / sizeof(i4CamEdges[0]), 1140, 4U);
}
