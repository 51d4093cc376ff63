#include <unity.h>
#include "errors.h"
#include "test_config.h"
#include "test_registry.h"
#include "test_errors.h"

void setUp(void)
{
  clearAllErrors();
}
void tearDown(void) {}

int main(void)
{
    UNITY_BEGIN();    // start unit testing

    testErrors();
    testConfig();
    testRegistry();

    return UNITY_END(); // stop unit testing
}
