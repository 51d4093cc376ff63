void testPulseTrain(void);
