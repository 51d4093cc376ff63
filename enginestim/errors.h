/** \file errors.h
 * @brief Error codes returned by the configuration and generation functions, and the list of currently active errors
 *
 * Every function that can reject an engine configuration returns one of the ERR_ codes below (ERR_NONE on success).
 * Rejections seen while registering engines are also pushed onto the active error list so that the application
 * can report them later (Eg. cycle through them on a status output).
 */
#ifndef ERRORS_H
#define ERRORS_H
#include <stdint.h>

#define ERR_NONE              0   //!< Success
#define ERR_INVALID_CYL_COUNT 1   //!< Cylinder count not supported or not a divider of the pulse train length
#define ERR_TDC_OUT_OF_RANGE  2   //!< A computed TDC position is outside the pulse train or collides with another one
#define ERR_CAM_EDGE_COUNT    3   //!< More camshaft edges than CAM_MAX_EDGES
#define ERR_CAM_EDGE_ORDER    4   //!< Camshaft edges are not strictly ascending
#define ERR_CAM_EDGE_RANGE    5   //!< Camshaft edge outside [0, PULSE_TRAIN_LEN)
#define ERR_CRANK_WHEEL       6   //!< Unsupported number of teeth or missing teeth
#define ERR_REGISTRY_FULL     7   //!< No free slot left in the engine registry
#define ERR_REGISTRY_LOCKED   8   //!< The engine registry no longer accepts new engines
#define ERR_UNKNOWN_ENGINE    9   //!< No engine registered under this name / index
#define ERR_ENGINE_NAME       10  //!< Engine name empty or already registered

#define MAX_ERRORS  4U  //The number of errors that can be active at the same time

/**
 * @brief Add an error to the list of active errors
 *
 * Adding an error that is already active does nothing.
 *
 * @param errorID One of the ERR_ codes, ERR_NONE is ignored
 * @return The slot the error is stored in, MAX_ERRORS if the list is full or errorID is ERR_NONE
 */
uint8_t setError(uint8_t errorID);

/** @brief Remove an error from the list of active errors */
void clearError(uint8_t errorID);

/** @brief Remove all errors from the list */
void clearAllErrors(void);

/**
 * @brief Get the next active error
 *
 * Each call returns the next entry of the list, wrapping around at the end.
 *
 * @return The error code, ERR_NONE if no error is active
 */
uint8_t getNextError(void);

/** @brief Number of currently active errors */
uint8_t errorCount(void);

/** @brief Short description of an error code, for diagnostics output */
const char * errorName(uint8_t errorID);

#endif
