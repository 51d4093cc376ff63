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
 * Wheel models.
 * Each wheel lives in its own file under wheels/ and is compiled as part of this unit.
 */
#include "globals.h"
#include "errors.h"
#include "wheels.h"

#include "wheels/wheel_missingTooth.cxx"
#include "wheels/wheel_cam.cxx"
