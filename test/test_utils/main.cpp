#include <unity.h>
#include "test_engbit.h"
#include "test_toothlog.h"
#include "test_timing.h"

void setUp(void) {}
void tearDown(void) {}

int main(void)
{
    UNITY_BEGIN();    // start unit testing

    testEngBit();
    testToothLog();
    testTiming();

    return UNITY_END(); // stop unit testing
}
