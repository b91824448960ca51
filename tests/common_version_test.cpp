#include <gtest/gtest.h>

#include "nodevis/common/version.hpp"

TEST(CommonVersionTest, ReturnsNonEmptyVersion) {
  EXPECT_FALSE(nodevis::common::version().empty());
}
