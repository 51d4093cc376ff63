void testErrors(void);
