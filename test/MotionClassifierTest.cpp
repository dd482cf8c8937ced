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
#include <list>

#include "posture/MotionClassifier.hpp"

namespace
{
    PersonTrack trackThrough(const unsigned int id, const std::vector<TrackPoint> &points)
    {
        PersonTrack track(id, points.front());
        for (size_t i = 1; i < points.size(); i++)
        {
            track.Update(points[i], 5000);
        }
        return track;
    }
}

TEST(MotionClassifierTest, FastDownwardMotionIsFalling)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    std::list<PersonTrack> tracks = {
        trackThrough(7, {TrackPoint(0.5, 0.1, 0), TrackPoint(0.5, 0.3, 250), TrackPoint(0.5, 0.5, 500)})};

    std::vector<FallingPersonEvent> events;
    classifier.DetectFalling(tracks, events);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].trackId, 7u);
    EXPECT_EQ(events[0].severity, Severity::High);
    EXPECT_EQ(events[0].timestampMillis, 500);
    EXPECT_DOUBLE_EQ(events[0].position.y, 0.5);
    // 0.4 / 0.5 sec
    EXPECT_NEAR(events[0].velocity, 0.8, 1e-9);
    EXPECT_TRUE(tracks.front().IsFalling());
}

TEST(MotionClassifierTest, FallingIsReportedOnce)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    std::list<PersonTrack> tracks = {
        trackThrough(1, {TrackPoint(0.5, 0.1, 0), TrackPoint(0.5, 0.3, 250), TrackPoint(0.5, 0.5, 500)})};

    std::vector<FallingPersonEvent> events;
    classifier.DetectFalling(tracks, events);
    ASSERT_EQ(events.size(), 1u);

    tracks.front().Update(TrackPoint(0.5, 0.7, 750), 5000);
    events.clear();
    classifier.DetectFalling(tracks, events);
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(tracks.front().IsFalling());
}

TEST(MotionClassifierTest, UpwardOrSlowMotionIsNotFalling)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    std::list<PersonTrack> tracks = {
        trackThrough(1, {TrackPoint(0.5, 0.5, 0), TrackPoint(0.5, 0.3, 250), TrackPoint(0.5, 0.1, 500)}),
        trackThrough(2, {TrackPoint(0.5, 0.5, 0), TrackPoint(0.5, 0.55, 250), TrackPoint(0.5, 0.6, 500)})};

    std::vector<FallingPersonEvent> events;
    classifier.DetectFalling(tracks, events);
    EXPECT_TRUE(events.empty());
}

TEST(MotionClassifierTest, ShortTrackIsNotEvaluated)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    std::list<PersonTrack> tracks = {trackThrough(1, {TrackPoint(0.5, 0.1, 0), TrackPoint(0.5, 0.9, 100)})};

    std::vector<FallingPersonEvent> events;
    classifier.DetectFalling(tracks, events);
    EXPECT_TRUE(events.empty());
}

TEST(MotionClassifierTest, OnlyLatestWindowIsConsidered)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    // 最初の区間だけが速い
    std::list<PersonTrack> tracks = {trackThrough(1, {TrackPoint(0.5, 0.1, 0), TrackPoint(0.5, 0.6, 100),
                                                      TrackPoint(0.5, 0.6, 200), TrackPoint(0.5, 0.6, 300)})};

    std::vector<FallingPersonEvent> events;
    classifier.DetectFalling(tracks, events);
    EXPECT_TRUE(events.empty());
}

TEST(MotionClassifierTest, WideBoxIsLying)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    const FrameObservation frame("f", 1200, {Detection(DetectionKind::Person, BboxXyxy(0.0, 0.0, 0.6, 0.2))});

    std::vector<LyingPersonEvent> events;
    classifier.DetectLying(frame, events);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_NEAR(events[0].aspectRatio, 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(events[0].confidence, 1.0);
    EXPECT_EQ(events[0].severity, Severity::Medium);
    EXPECT_EQ(events[0].timestampMillis, 1200);
}

TEST(MotionClassifierTest, LyingConfidenceIsClamped)
{
    MotionClassifier classifier(0.3, 3, 2.0);
    const FrameObservation frame("f", 0, {Detection(DetectionKind::Person, BboxXyxy(0.0, 0.0, 0.25, 0.1))});

    std::vector<LyingPersonEvent> events;
    classifier.DetectLying(frame, events);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_NEAR(events[0].confidence, 1.0, 1e-9);
}

TEST(MotionClassifierTest, UprightOrNonPersonIsNotLying)
{
    MotionClassifier classifier(0.3, 3, 1.5);
    const FrameObservation frame("f", 0,
                                 {Detection(DetectionKind::Person, BboxXyxy(0.0, 0.0, 0.15, 0.1)),
                                  Detection(DetectionKind::Person, BboxXyxy(0.0, 0.0, 0.1, 0.4)),
                                  Detection(DetectionKind::Other, BboxXyxy(0.0, 0.0, 0.6, 0.2), "Car")});

    std::vector<LyingPersonEvent> events;
    classifier.DetectLying(frame, events);
    EXPECT_TRUE(events.empty());
}
