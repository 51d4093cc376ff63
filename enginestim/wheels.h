/** \file wheels.h
 * @brief Crankshaft and camshaft wheel models
 *
 * A wheel model describes the geometry of a wheel (teeth, missing teeth, edge angles) and provides the small state trackers
 * the pulse train generator steps through, one angle unit at a time.
 */
#ifndef WHEELS_H
#define WHEELS_H

#include "globals.h"

//Crank wheel presets. The _INV variants hold the signal HIGH during the gap, the others hold it LOW
#define CRANK_WHEEL_30_1        0
#define CRANK_WHEEL_30_2        1
#define CRANK_WHEEL_60_1        2
#define CRANK_WHEEL_60_2        3
#define CRANK_WHEEL_120_1       4
#define CRANK_WHEEL_120_2       5
#define CRANK_WHEEL_30_1_INV    6
#define CRANK_WHEEL_30_2_INV    7
#define CRANK_WHEEL_60_1_INV    8
#define CRANK_WHEEL_60_2_INV    9
#define CRANK_WHEEL_120_1_INV   10
#define CRANK_WHEEL_120_2_INV   11
#define CRANK_WHEEL_PRESETS     12

/** Crankshaft missing tooth wheel.
 * The reference (angle 0) is the end of the gap, so the gap occupies the last missingTeeth tooth pitches of each revolution.
 */
struct crankWheel_t {
  uint8_t toothCount;   //Number of tooth positions on the wheel, including the missing ones (30, 60 or 120)
  uint8_t missingTeeth; //Number of missing teeth forming the gap (1 or 2)
  bool    gapInverted;  //When set the wheel starts LOW and the gap is held HIGH
};

/** Camshaft wheel.
 * Edge angles are relative to the first crank gap, in angle units, strictly ascending. Unused slots hold CAM_EDGE_UNUSED
 * and the first unused slot ends the list.
 */
struct camWheel_t {
  Level   firstLevel;                   //Level when the first crankshaft gap is met
  int16_t edgeAngles[CAM_MAX_EDGES];
};

#include "wheels/wheel_missingTooth.h"
#include "wheels/wheel_cam.h"

#endif
