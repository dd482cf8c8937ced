/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>
#include <stdexcept>

#include "utils/FrameHistory.hpp"

TEST(FrameHistoryTest, EvictsOldestBeyondMaxSize)
{
    FrameHistory<int> history(3);
    for (int i = 0; i < 5; i++)
    {
        history.Push(i);
    }
    ASSERT_EQ(history.Size(), 3u);
    EXPECT_EQ(history.Items().front(), 2);
    EXPECT_EQ(history.Latest(), 4);
}

TEST(FrameHistoryTest, ShrinkingMaxSizeDropsOldest)
{
    FrameHistory<int> history(5);
    for (int i = 0; i < 5; i++)
    {
        history.Push(i);
    }
    history.SetMaxSize(2);
    ASSERT_EQ(history.Size(), 2u);
    EXPECT_EQ(history.Items().front(), 3);
    EXPECT_EQ(history.MaxSize(), 2u);
}

TEST(FrameHistoryTest, LatestOnEmptyThrows)
{
    FrameHistory<int> history;
    EXPECT_TRUE(history.Empty());
    EXPECT_THROW(history.Latest(), std::out_of_range);

    history.Push(1);
    history.Clear();
    EXPECT_TRUE(history.Empty());
}
