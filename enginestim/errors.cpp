/** @file
 * Active error list.
 * The list is a small fixed array, errors are appended at the end and removing one shifts the following ones 'down'.
 */
#include "errors.h"

static uint8_t errorCounter = 0;
static uint8_t errorCodes[MAX_ERRORS];
static uint8_t nextErrorSlot = 0;

uint8_t setError(uint8_t errorID)
{
  if(errorID == ERR_NONE) { return MAX_ERRORS; }

  for(uint8_t x = 0; x < errorCounter; x++)
  {
    if(errorCodes[x] == errorID) { return x; } //Already active
  }

  if(errorCounter < MAX_ERRORS)
  {
    errorCodes[errorCounter] = errorID;
    errorCounter++;
    return (errorCounter - 1U);
  }
  return MAX_ERRORS;
}

void clearError(uint8_t errorID)
{
  uint8_t clearedError = UINT8_MAX;

  for(uint8_t x = 0; x < errorCounter; x++)
  {
    if(errorCodes[x] == errorID) { clearedError = x; break; }
  }

  if(clearedError < MAX_ERRORS)
  {
    errorCodes[clearedError] = ERR_NONE;
    //Clear the required error and move any from above it 'down' in the error array
    for (uint8_t x = clearedError; x < (errorCounter - 1U); x++)
    {
      errorCodes[x] = errorCodes[x+1U];
      errorCodes[x+1U] = ERR_NONE;
    }
    errorCounter--;
    if(nextErrorSlot >= errorCounter) { nextErrorSlot = 0; }
  }
}

void clearAllErrors(void)
{
  for(uint8_t x = 0; x < MAX_ERRORS; x++) { errorCodes[x] = ERR_NONE; }
  errorCounter = 0;
  nextErrorSlot = 0;
}

uint8_t getNextError(void)
{
  if(errorCounter == 0U) { return ERR_NONE; }

  if(nextErrorSlot >= errorCounter) { nextErrorSlot = 0; }
  uint8_t currentError = errorCodes[nextErrorSlot];
  nextErrorSlot++;

  return currentError;
}

uint8_t errorCount(void)
{
  return errorCounter;
}

const char * errorName(uint8_t errorID)
{
  switch(errorID)
  {
    case ERR_NONE:              return "none";
    case ERR_INVALID_CYL_COUNT: return "invalid cylinder count";
    case ERR_TDC_OUT_OF_RANGE:  return "TDC out of range";
    case ERR_CAM_EDGE_COUNT:    return "too many cam edges";
    case ERR_CAM_EDGE_ORDER:    return "cam edges not ascending";
    case ERR_CAM_EDGE_RANGE:    return "cam edge out of range";
    case ERR_CRANK_WHEEL:       return "unsupported crank wheel";
    case ERR_REGISTRY_FULL:     return "engine registry full";
    case ERR_REGISTRY_LOCKED:   return "engine registry locked";
    case ERR_UNKNOWN_ENGINE:    return "unknown engine";
    case ERR_ENGINE_NAME:       return "invalid engine name";
    default:                    return "unknown error";
  }
}
