#ifndef _TESTING_DEFINES_H_
#define _TESTING_DEFINES_H_

#if ENABLE_UNIT_TESTS
#define T(x)            x
#define MY_TEST(x, y)   TEST(x, y)
#define MY_TEST_F(x, y) TEST_F(x, y)
#else
#define T(x)            FILTERED_##x
#define MY_TEST(x, y)   TEST(FILTERED_##x, y)
#define MY_TEST_F(x, y) TEST_F(FILTERED_##x, y)
#endif

#endif
