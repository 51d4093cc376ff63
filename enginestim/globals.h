/** @file
 * Global defines, macros and the signal level type shared by the wheel models, the TDC placement and the pulse train generator.
 *
 * ### Angle units
 *
 * All angles are stored as integer tenths of a degree (DEG_U16_DEC1). One full engine cycle (two crank revolutions, 720 degrees)
 * is @ref PULSE_TRAIN_LEN units long and the pulse train buffer has exactly one element per unit, ie the array index IS the
 * crank angle since the first crank gap.
 *
 * ### Pulse train element layout
 *
 * | Bit | Desc.       |
 * |:----|-------------|
 * |0    | Camshaft    |
 * |1    | Crankshaft  |
 * |2    | TDC cyl. 1  |
 * |3    | TDC cyl. 2  |
 * |4    | TDC cyl. 3  |
 * |5    | TDC cyl. 4  |
 * |6    | TDC cyl. 5  |
 * |7    | TDC cyl. 6  |
 *
 * The layout is the contract with whatever drives the buffer onto the output port, it is identical for every element width.
 */
#ifndef GLOBALS_H
#define GLOBALS_H
#include <stdint.h>

//Handy bitsetting macros
#define BIT_SET(a,b) ((a) |= (1U<<(b)))
#define BIT_CHECK(var,pos) !!((var) & (1U<<(pos)))

#define NANOS_PER_SEC   UINT64_C(1000000000)
#define MICROS_PER_SEC  INT32_C(1000000)
#define MICROS_PER_MIN  INT32_C(MICROS_PER_SEC*60U)

#define ANGLE_UNITS_PER_DEG   10U   //Angles are stored in 0.1 degree steps
#define ANGLE_UNITS_PER_REV   3600U //One crank revolution (360 degrees)
#define PULSE_TRAIN_LEN       7200U //One engine cycle (720 degrees), also the number of elements in a pulse train

//Bit positions within a pulse train element
#define PT_BIT_CAM      0
#define PT_BIT_CRK      1
#define PT_BIT_TDC0     2

#define TDC_MAX_CYL     6U    //Number of TDC bits available in a pulse train element
#define CAM_MAX_EDGES   20U   //Maximum number of camshaft edges per engine cycle
#define CAM_EDGE_UNUSED (-1)  //Sentinel for unused camshaft edge slots

/** \enum Level
 * @brief Logic level of one of the emulated signals
 * */
enum Level {
  LEVEL_LOW = 0,
  LEVEL_HIGH = 1
};

/** Complement of a level (HIGH <-> LOW). */
static inline Level invertLevel(Level lvl) { return (lvl == LEVEL_HIGH) ? LEVEL_LOW : LEVEL_HIGH; }

#endif // GLOBALS_H
