/** \file engbit.h
 * @brief Pulse train element bit manipulation
 *
 * Defines the helpers used to read and write the camshaft, crankshaft and TDC signals inside one pulse train element,
 * using masks. The element type follows the width of the GPIO port the pulse train is written to (8, 16 or 32 bits).
 * The bit positions never change with the width, see globals.h.
 */
#ifndef ENGBIT_H
#define ENGBIT_H
#include <stdint.h>
#include <type_traits>
#include "globals.h"

template<typename T>
struct EngBit
{
  static_assert(std::is_same<T, uint8_t>::value || std::is_same<T, uint16_t>::value || std::is_same<T, uint32_t>::value,
                "Pulse train elements must be uint8_t, uint16_t or uint32_t");

  static constexpr T CAM_MSK = (T)(1U << PT_BIT_CAM); //!< Camshaft signal mask
  static constexpr T CRK_MSK = (T)(1U << PT_BIT_CRK); //!< Crankshaft signal mask

  /** TDC mask for cylinder `cyl` (0 based). Cylinders past TDC_MAX_CYL have no bit and get an empty mask. */
  static constexpr T tdcMask(uint8_t cyl) { return (cyl < TDC_MAX_CYL) ? (T)(1U << (PT_BIT_TDC0 + cyl)) : (T)0U; }

  /** Mask of all the TDC bits */
  static constexpr T TDC_ALL_MSK = (T)(((1U << TDC_MAX_CYL) - 1U) << PT_BIT_TDC0);

  static inline void setLevel(T &val, T mask, Level lvl)
  {
    if(lvl == LEVEL_HIGH) { val |= mask; }
    else { val &= (T)~mask; }
  }

  static inline Level getLevel(T val, T mask) { return ((val & mask) != 0U) ? LEVEL_HIGH : LEVEL_LOW; }

  /// Set camshaft signal bit to lvl
  static inline void setCam(T &val, Level lvl) { setLevel(val, CAM_MSK, lvl); }
  /// Camshaft signal level
  static inline Level getCam(T val) { return getLevel(val, CAM_MSK); }

  /// Set crankshaft signal bit to lvl
  static inline void setCrk(T &val, Level lvl) { setLevel(val, CRK_MSK, lvl); }
  /// Crankshaft signal level
  static inline Level getCrk(T val) { return getLevel(val, CRK_MSK); }

  /// Set the TDC bit of cylinder cyl to lvl. Out of range cylinders are left untouched.
  static inline void setTdc(T &val, uint8_t cyl, Level lvl) { setLevel(val, tdcMask(cyl), lvl); }
  /// TDC level of cylinder cyl. Out of range cylinders always read LOW.
  static inline Level getTdc(T val, uint8_t cyl) { return getLevel(val, tdcMask(cyl)); }
};

#endif
