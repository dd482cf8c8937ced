/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <thread>

#include "pipeline/SafetyAnalyzer.hpp"

namespace
{
    Detection personBox(const double x, const double y, const double w, const double h)
    {
        return Detection(DetectionKind::Person, BboxXyxy(x - w / 2, y - h / 2, x + w / 2, y + h / 2), "Person");
    }

    FrameObservation frameOf(const int64_t timestampMillis, const std::vector<Detection> &detections)
    {
        return FrameObservation("frame-" + std::to_string(timestampMillis), timestampMillis, detections);
    }
}

TEST(SafetyAnalyzerTest, EmptyFramesAreSafe)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    for (int64_t t = 0; t < 4000; t += 100)
    {
        analyzer.ProcessFrame(frameOf(t, {}), result);
        EXPECT_EQ(result.overallSafetyStatus, SafetyStatus::Safe);
        EXPECT_EQ(result.personCount, 0);
        EXPECT_EQ(result.occupancyLevel, OccupancyLevel::Low);
        EXPECT_TRUE(result.densitySurges.empty());
        EXPECT_TRUE(result.fallingPersons.empty());
        EXPECT_TRUE(result.lyingPersons.empty());
    }

    const SafetyStats stats = analyzer.GetStats();
    EXPECT_EQ(stats.processedFrameCount, 40u);
    EXPECT_EQ(stats.frameHistoryLength, 30u);
    EXPECT_EQ(stats.activeTrackCount, 0u);
    EXPECT_EQ(stats.densityZoneCount, 64u);
}

TEST(SafetyAnalyzerTest, StatsBeforeFirstFrame)
{
    SafetyAnalyzer analyzer;
    const SafetyStats stats = analyzer.GetStats();
    EXPECT_EQ(stats.activeTrackCount, 0u);
    EXPECT_EQ(stats.frameHistoryLength, 0u);
    EXPECT_EQ(stats.densityZoneCount, 0u);
    EXPECT_FALSE(stats.hasLastAnalysis);
    EXPECT_EQ(stats.processedFrameCount, 0u);
}

TEST(SafetyAnalyzerTest, HistoryIsBounded)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    for (int64_t t = 0; t < 40; t++)
    {
        analyzer.ProcessFrame(frameOf(t * 100, {personBox(0.5, 0.5, 0.1, 0.2)}), result);
    }

    const SafetyStats stats = analyzer.GetStats();
    EXPECT_EQ(stats.frameHistoryLength, 30u);
    EXPECT_EQ(stats.densityZoneCount, 64u);
    EXPECT_EQ(stats.activeTrackCount, 1u);
    EXPECT_TRUE(stats.hasLastAnalysis);
    EXPECT_EQ(stats.lastAnalysisTimestamp, 3900);
    EXPECT_EQ(stats.processedFrameCount, 40u);
}

TEST(SafetyAnalyzerTest, FallingPersonIsCritical)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    analyzer.ProcessFrame(frameOf(0, {personBox(0.5, 0.1, 0.1, 0.2)}), result);
    analyzer.ProcessFrame(frameOf(250, {personBox(0.5, 0.25, 0.1, 0.2)}), result);
    EXPECT_TRUE(result.fallingPersons.empty());

    analyzer.ProcessFrame(frameOf(500, {personBox(0.5, 0.4, 0.1, 0.2)}), result);
    ASSERT_EQ(result.fallingPersons.size(), 1u);
    EXPECT_EQ(result.fallingPersons[0].trackId, 1u);
    EXPECT_EQ(result.overallSafetyStatus, SafetyStatus::Critical);

    // 同じトラックは再検出しない
    analyzer.ProcessFrame(frameOf(750, {personBox(0.5, 0.55, 0.1, 0.2)}), result);
    EXPECT_TRUE(result.fallingPersons.empty());
}

TEST(SafetyAnalyzerTest, TwoLyingPersonsIsWarning)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    analyzer.ProcessFrame(frameOf(0, {personBox(0.2, 0.8, 0.3, 0.1), personBox(0.7, 0.8, 0.3, 0.1)}), result);

    EXPECT_EQ(result.lyingPersons.size(), 2u);
    EXPECT_TRUE(result.densitySurges.empty());
    EXPECT_EQ(result.overallSafetyStatus, SafetyStatus::Warning);
    EXPECT_EQ(result.personCount, 2);
}

TEST(SafetyAnalyzerTest, SurgeIntoEmptyCellIsCritical)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    analyzer.ProcessFrame(frameOf(0, {}), result);
    analyzer.ProcessFrame(frameOf(100, {personBox(0.3, 0.3, 0.1, 0.2)}), result);

    ASSERT_EQ(result.densitySurges.size(), 1u);
    EXPECT_TRUE(result.densitySurges[0].isFromEmpty);
    EXPECT_EQ(result.densitySurges[0].severity, Severity::High);
    EXPECT_EQ(result.overallSafetyStatus, SafetyStatus::Critical);
}

TEST(SafetyAnalyzerTest, InvalidBoxesAreDroppedAndCounted)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    analyzer.ProcessFrame(frameOf(0, {personBox(0.5, 0.5, 0.1, 0.2),
                                      Detection(DetectionKind::Person, BboxXyxy(0.6, 0.1, 0.4, 0.3)),
                                      Detection(DetectionKind::Person, BboxXyxy(nan, 0.1, 0.4, 0.3))}),
                          result);

    EXPECT_EQ(result.personCount, 1);
    EXPECT_EQ(analyzer.GetStats().droppedDetectionCount, 2u);
    EXPECT_EQ(analyzer.GetStats().activeTrackCount, 1u);
}

TEST(SafetyAnalyzerTest, OccupancyLevelFollowsPersonCount)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    std::vector<Detection> crowd;
    for (int k = 0; k < 11; k++)
    {
        crowd.push_back(personBox(0.05 + 0.085 * k, 0.5, 0.05, 0.2));
    }
    analyzer.ProcessFrame(frameOf(0, crowd), result);
    EXPECT_EQ(result.personCount, 11);
    EXPECT_EQ(result.occupancyLevel, OccupancyLevel::High);

    crowd.resize(6);
    analyzer.ProcessFrame(frameOf(100, crowd), result);
    EXPECT_EQ(result.occupancyLevel, OccupancyLevel::Medium);
}

TEST(SafetyAnalyzerTest, ResetClearsStateButNotIds)
{
    SafetyAnalyzer analyzer;
    SafetyAnalysisResult result;
    analyzer.ProcessFrame(frameOf(0, {personBox(0.5, 0.1, 0.1, 0.2)}), result);
    analyzer.Reset();

    SafetyStats stats = analyzer.GetStats();
    EXPECT_EQ(stats.activeTrackCount, 0u);
    EXPECT_EQ(stats.frameHistoryLength, 0u);
    EXPECT_FALSE(stats.hasLastAnalysis);

    // 新しいトラックは ID 2 から
    analyzer.ProcessFrame(frameOf(100, {personBox(0.5, 0.1, 0.1, 0.2)}), result);
    analyzer.ProcessFrame(frameOf(350, {personBox(0.5, 0.25, 0.1, 0.2)}), result);
    analyzer.ProcessFrame(frameOf(600, {personBox(0.5, 0.4, 0.1, 0.2)}), result);
    ASSERT_EQ(result.fallingPersons.size(), 1u);
    EXPECT_EQ(result.fallingPersons[0].trackId, 2u);
}

TEST(SafetyAnalyzerTest, ConcurrentCallsAreSerialized)
{
    SafetyAnalyzer analyzer;
    auto worker = [&analyzer](const double x) {
        SafetyAnalysisResult result;
        for (int64_t t = 0; t < 50; t++)
        {
            analyzer.ProcessFrame(frameOf(t * 10, {personBox(x, 0.5, 0.1, 0.2)}), result);
        }
    };
    std::thread t1(worker, 0.2);
    std::thread t2(worker, 0.8);
    t1.join();
    t2.join();

    EXPECT_EQ(analyzer.GetStats().processedFrameCount, 100u);
}

TEST(SafetyAnalyzerTest, InvalidConfigIsRejectedAtConstruction)
{
    AnalyzerConfig shortHistory;
    shortHistory.maxFrameHistory = 1;
    EXPECT_THROW(SafetyAnalyzer analyzer(shortHistory), std::invalid_argument);

    AnalyzerConfig noWindow;
    noWindow.fallingWindowSize = 0;
    EXPECT_THROW(SafetyAnalyzer analyzer(noWindow), std::invalid_argument);

    AnalyzerConfig valid;
    valid.maxFrameHistory = 2;
    EXPECT_NO_THROW(SafetyAnalyzer analyzer(valid));
}
