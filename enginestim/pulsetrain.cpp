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
 * Pulse train fingerprints.
 */
#include <FastCRC.h>
#include "pulsetrain.h"

static_assert(sizeof(uint32_t) * PULSE_TRAIN_LEN <= UINT16_MAX, "FastCRC takes the data length as uint16_t");

static uint32_t bufferCRC32(const uint8_t *data, uint16_t length)
{
  FastCRC32 CRC32;
  return CRC32.crc32(data, length);
}

uint32_t pulseTrainCRC32(const uint8_t (&pt)[PULSE_TRAIN_LEN])
{
  return bufferCRC32(pt, (uint16_t)sizeof(pt));
}

uint32_t pulseTrainCRC32(const uint16_t (&pt)[PULSE_TRAIN_LEN])
{
  return bufferCRC32((const uint8_t *)pt, (uint16_t)sizeof(pt));
}

uint32_t pulseTrainCRC32(const uint32_t (&pt)[PULSE_TRAIN_LEN])
{
  return bufferCRC32((const uint8_t *)pt, (uint16_t)sizeof(pt));
}
