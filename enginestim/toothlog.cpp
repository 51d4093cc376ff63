/** @file
 * Composite log storage.
 */
#include "toothlog.h"

void compositeLogReset(compositeLog_t &log)
{
  log.count = 0;
  log.overflowed = false;
}

void compositeLogAdd(compositeLog_t &log, uint16_t angle, uint8_t state)
{
  if(log.count >= TOOTH_LOG_SIZE)
  {
    log.overflowed = true;
    return;
  }
  log.entries[log.count].angle = angle;
  log.entries[log.count].state = state;
  log.count++;
}
