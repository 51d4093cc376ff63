/** \file registry.h
 * @brief Table of the named engine configurations known to the application
 *
 * The registry is filled once at startup (see loadDefaultEngines()), then locked and passed down to whoever needs to
 * look an engine up. It holds copies of the configurations in a fixed array, nothing is allocated.
 */
#ifndef REGISTRY_H
#define REGISTRY_H
#include "globals.h"
#include "config.h"

#define MAX_ENGINES       8U
#define ENGINE_NAME_LEN   16U   //Including the terminating 0. Longer names are truncated and lookups only compare the kept characters

class EngineRegistryClass
{

public:

	EngineRegistryClass();

	/**
	 * @brief Validate an engine configuration and store a copy of it under name
	 *
	 * Any rejection is also added to the active error list.
	 *
	 * @return ERR_NONE, ERR_REGISTRY_LOCKED, ERR_REGISTRY_FULL, ERR_ENGINE_NAME or the validation error of cfg
	 */
	uint8_t registerEngine(const char *name, const engineConfig_t &cfg);

	/** @brief Refuse any further registration */
	void lock(void) { locked = true; }
	bool isLocked(void) const { return locked; }

	uint8_t count(void) const { return engineCount; }

	/** @return The engine at index, nullptr when out of range */
	const engineConfig_t * getEngine(uint8_t index) const;
	/** @return The engine registered under name, nullptr when unknown */
	const engineConfig_t * findEngine(const char *name) const;
	/** @return Index of the engine registered under name, MAX_ENGINES when unknown */
	uint8_t indexOf(const char *name) const;
	/** @return Name of the engine at index, nullptr when out of range */
	const char * engineName(uint8_t index) const;

private:

	struct engineEntry_t {
	  char           name[ENGINE_NAME_LEN];
	  engineConfig_t config;
	};

	engineEntry_t entries[MAX_ENGINES];
	uint8_t engineCount;
	bool locked;
};

#endif
