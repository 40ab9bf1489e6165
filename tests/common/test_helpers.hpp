#pragma once

#include <gtest/gtest.h>

#include <string>

#include "tq/common.hpp"

namespace tq::test {

// Reference instant for time-dependent tests: Monday 2024-01-01 10:00
DateTime referenceNow();

// Shorthand for building expected instants
DateTime at(int year, int month, int day, int hour = 0, int minute = 0);

// "2024-01-02T17:00:00" rendering for readable failure messages
std::string iso(DateTime time);

// Generate random string for testing
std::string randomString(size_t length);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace tq::test
