/** \file enginestim.h
 * @brief Engine position signal generator
 *
 * Builds, for a 4-stroke engine, the pulse train carrying the crankshaft wheel signal, the camshaft wheel signal and
 * one TDC marker per cylinder over a full 720 degree cycle. The pulse train is meant to be streamed to an ECU under test.
 *
 * Limitations:
 * - Engines with more than 6 cylinders
 * - Asymmetrical engines (TDCs not evenly spaced)
 */

#ifndef ENGINESTIM_H
#define ENGINESTIM_H

#include "globals.h"
#include "errors.h"
#include "engbit.h"
#include "wheels.h"
#include "tdc.h"
#include "config.h"
#include "registry.h"
#include "pulsetrain.h"
#include "toothlog.h"
#include "timing.h"

#endif
