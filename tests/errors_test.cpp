#include "core/Errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using stepwise::core::formatErrorChain;

namespace {
  std::exception_ptr chainOf(int depth) {
    try {
      try {
        try {
          throw std::runtime_error("permission denied");
        } catch (...) {
          if (depth < 2)
            throw;
          std::throw_with_nested(std::runtime_error("can't open `out/report.txt`"));
        }
      } catch (...) {
        if (depth < 1)
          throw;
        std::throw_with_nested(std::runtime_error("report step failed"));
      }
    } catch (...) {
      return std::current_exception();
    }
    return nullptr;
  }
} // namespace

TEST(error_chain, single_error_is_just_the_message) {
  EXPECT_EQ(formatErrorChain(std::runtime_error("Coins landed differently")),
            "Coins landed differently");
}

TEST(error_chain, nested_causes_follow_outermost_first) {
  EXPECT_EQ(formatErrorChain(chainOf(2)),
            "report step failed\nCaused by:\n\tcan't open `out/report.txt`\n\tpermission denied");
}

TEST(error_chain, non_standard_exceptions_render_as_unknown) {
  EXPECT_EQ(formatErrorChain(std::make_exception_ptr(7)), "unknown error");
  EXPECT_EQ(formatErrorChain(std::exception_ptr{}), "unknown error");
}

TEST(error_kinds, pending_step_error_is_a_step_error) {
  stepwise::core::PendingStepError pending("blocked");
  const stepwise::core::StepError& asStep = pending;
  EXPECT_STREQ(asStep.what(), "blocked");
}
