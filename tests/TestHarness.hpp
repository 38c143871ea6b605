#pragma once
#include <cstdio>

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            fprintf(stderr, "FAIL: %s - %s\n", __func__, message); \
            return false; \
        } \
    } while(0)

#define RUN_TEST(test_func) \
    do { \
        printf("Running: %s ... ", #test_func); \
        fflush(stdout); \
        if (test_func()) { \
            printf("PASS\n"); \
            passed++; \
        } else { \
            printf("FAIL\n"); \
            failed++; \
        } \
        total++; \
    } while(0)

#define PRINT_RESULTS() \
    do { \
        printf("\n===================================\n"); \
        printf("Results: %d total, %d passed, %d failed\n", total, passed, failed); \
    } while(0)
