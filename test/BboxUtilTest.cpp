/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "tracking/BboxUtil.hpp"

TEST(BboxUtilTest, CenterIsMidpoint)
{
    const cv::Point2d c = BboxUtil::Center(BboxXyxy(0.2, 0.4, 0.6, 0.8));
    EXPECT_DOUBLE_EQ(c.x, 0.4);
    EXPECT_DOUBLE_EQ(c.y, 0.6);
}

TEST(BboxUtilTest, AspectRatioIsWidthOverHeight)
{
    EXPECT_DOUBLE_EQ(BboxUtil::AspectRatio(BboxXyxy(0.0, 0.0, 0.6, 0.2)), 3.0);
    EXPECT_DOUBLE_EQ(BboxUtil::AspectRatio(BboxXyxy(0.0, 0.0, 0.1, 0.4)), 0.25);
}

TEST(BboxUtilTest, AspectRatioOfFlatBoxIsZero)
{
    EXPECT_DOUBLE_EQ(BboxUtil::AspectRatio(BboxXyxy(0.0, 0.5, 0.6, 0.5)), 0.0);
}

TEST(BboxUtilTest, Distance)
{
    EXPECT_DOUBLE_EQ(BboxUtil::Distance(cv::Point2d(0.0, 0.0), cv::Point2d(0.3, 0.4)), 0.5);
}

TEST(BboxUtilTest, IsValid)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(BboxUtil::IsValid(BboxXyxy(0.1, 0.1, 0.2, 0.2)));
    EXPECT_FALSE(BboxUtil::IsValid(BboxXyxy(0.2, 0.1, 0.1, 0.2)));
    EXPECT_FALSE(BboxUtil::IsValid(BboxXyxy(0.1, 0.1, 0.1, 0.2)));
    EXPECT_FALSE(BboxUtil::IsValid(BboxXyxy(0.1, 0.3, 0.2, 0.2)));
    EXPECT_FALSE(BboxUtil::IsValid(BboxXyxy(nan, 0.1, 0.2, 0.2)));
    EXPECT_FALSE(BboxUtil::IsValid(BboxXyxy(0.1, 0.1, inf, 0.2)));
}
