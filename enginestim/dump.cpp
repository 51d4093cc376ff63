/*
enginestim - Engine position signal generator for ECU development
Based on Speeduino, Copyright (C) Josh Stewart

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU General Public License
as published by the Free Software Foundation; either version 2
of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.
*/
/** @file
 * Host diagnostics tool: generates the pulse train of one of the built-in engines and prints its composite log.
 *
 * Usage: enginestim_dump [engine name or index] [rpm] [timer Hz]
 */
#include <stdio.h>
#include <stdlib.h>
#include "enginestim.h"

#define DEFAULT_RPM       1000U
#define DEFAULT_TIMER_HZ  1000000UL

static uint8_t pulseTrain[PULSE_TRAIN_LEN];
static compositeLog_t compositeLog;

static void printErrors(void)
{
  uint8_t activeErrors = errorCount();
  for(uint8_t x = 0; x < activeErrors; x++)
  {
    uint8_t errorID = getNextError();
    fprintf(stderr, "error %u: %s\n", errorID, errorName(errorID));
  }
}

static uint8_t selectEngine(const EngineRegistryClass &engines, const char *arg)
{
  if(arg == nullptr) { return 0; }

  uint8_t index = engines.indexOf(arg);
  if(index < MAX_ENGINES) { return index; }

  char *end = nullptr;
  unsigned long number = strtoul(arg, &end, 10);
  if( (end != arg) && (*end == '\0') && (number < engines.count()) ) { return (uint8_t)number; }

  return MAX_ENGINES;
}

static void printCompositeLog(void)
{
  printf("angle   cam crk tdc cyl1\n");
  for(uint16_t x = 0; x < compositeLog.count; x++)
  {
    uint8_t state = compositeLog.entries[x].state;
    printf("%4u.%u  %u   %u   %u   %u\n",
      compositeLog.entries[x].angle / ANGLE_UNITS_PER_DEG, compositeLog.entries[x].angle % ANGLE_UNITS_PER_DEG,
      BIT_CHECK(state, COMPOSITE_LOG_CAM), BIT_CHECK(state, COMPOSITE_LOG_CRK),
      BIT_CHECK(state, COMPOSITE_LOG_TDC), BIT_CHECK(state, COMPOSITE_LOG_CYL0));
  }
  if(compositeLog.overflowed == true) { printf("(log truncated at %u entries)\n", TOOTH_LOG_SIZE); }
}

int main(int argc, char *argv[])
{
  EngineRegistryClass engines;

  if(loadDefaultEngines(engines) != ERR_NONE)
  {
    printErrors();
    return EXIT_FAILURE;
  }
  engines.lock();

  uint8_t engineIndex = selectEngine(engines, (argc > 1) ? argv[1] : nullptr);
  const engineConfig_t *engine = engines.getEngine(engineIndex);
  if(engine == nullptr)
  {
    setError(ERR_UNKNOWN_ENGINE);
    printErrors();
    fprintf(stderr, "known engines:\n");
    for(uint8_t x = 0; x < engines.count(); x++) { fprintf(stderr, "  %u: %s\n", x, engines.engineName(x)); }
    return EXIT_FAILURE;
  }

  uint16_t rpm = (argc > 2) ? (uint16_t)strtoul(argv[2], nullptr, 10) : DEFAULT_RPM;
  uint32_t timerHz = (argc > 3) ? (uint32_t)strtoul(argv[3], nullptr, 10) : DEFAULT_TIMER_HZ;

  generatePulseTrain(*engine, pulseTrain);
  buildCompositeLog(pulseTrain, compositeLog);

  printf("engine:        %s\n", engines.engineName(engineIndex));
  printf("crank wheel:   %u-%u%s\n", engine->crank.toothCount, engine->crank.missingTeeth, engine->crank.gapInverted ? " (gap HIGH)" : "");
  printf("cam edges:     %u\n", camEdgeCount(engine->cam));
  printf("cylinders:     %u\n", engine->nCylinders);
  printf("crank edges:   %u\n", countSignalEdges(pulseTrain, COMPOSITE_LOG_CRK));
  printf("pulse train:   %u bytes, CRC32 0x%08lX\n", (unsigned)sizeof(pulseTrain), (unsigned long)pulseTrainCRC32(pulseTrain));
  printf("at %u RPM:    %lu nS per element, %lu ticks at %lu Hz, %lu uS per cycle\n",
    rpm, (unsigned long)samplePeriodNs(rpm), (unsigned long)timerTicksPerSample(rpm, timerHz), (unsigned long)timerHz, (unsigned long)cycleTimeUs(rpm));
  printCompositeLog();

  return EXIT_SUCCESS;
}
