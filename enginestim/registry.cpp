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
 * Engine registry: named, validated engine configurations.
 */
#include <string.h>
#include "errors.h"
#include "registry.h"


EngineRegistryClass::EngineRegistryClass()
{
	engineCount = 0;
	locked = false;
	memset(entries, 0, sizeof(entries));
}

uint8_t EngineRegistryClass::registerEngine(const char *name, const engineConfig_t &cfg)
{
  uint8_t result = ERR_NONE;
  char shortName[ENGINE_NAME_LEN];

  if(locked == true) { result = ERR_REGISTRY_LOCKED; }
  else if(engineCount >= MAX_ENGINES) { result = ERR_REGISTRY_FULL; }
  else if( (name == nullptr) || (name[0] == '\0') ) { result = ERR_ENGINE_NAME; }
  else
  {
    strncpy(shortName, name, ENGINE_NAME_LEN - 1U);
    shortName[ENGINE_NAME_LEN - 1U] = '\0';

    if(indexOf(shortName) < MAX_ENGINES) { result = ERR_ENGINE_NAME; }
    else { result = validateEngineConfig(cfg); }
  }

  if(result != ERR_NONE)
  {
    setError(result);
    return result;
  }

  memcpy(entries[engineCount].name, shortName, ENGINE_NAME_LEN);
  entries[engineCount].config = cfg;
  engineCount++;

  return ERR_NONE;
}

const engineConfig_t * EngineRegistryClass::getEngine(uint8_t index) const
{
  if(index >= engineCount) { return nullptr; }
  return &entries[index].config;
}

const engineConfig_t * EngineRegistryClass::findEngine(const char *name) const
{
  return getEngine(indexOf(name));
}

uint8_t EngineRegistryClass::indexOf(const char *name) const
{
  if(name == nullptr) { return MAX_ENGINES; }

  for(uint8_t x = 0; x < engineCount; x++)
  {
    if(strncmp(entries[x].name, name, ENGINE_NAME_LEN - 1U) == 0) { return x; }
  }
  return MAX_ENGINES;
}

const char * EngineRegistryClass::engineName(uint8_t index) const
{
  if(index >= engineCount) { return nullptr; }
  return entries[index].name;
}
