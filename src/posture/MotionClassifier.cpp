/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "MotionClassifier.hpp"
#include "MathUtil.hpp"
#include <cstddef>
#include "tracking/BboxUtil.hpp"

MotionClassifier::MotionClassifier()
    : fallingVelocityThreshold(0.3), fallingWindowSize(3), lyingAspectRatioThreshold(1.5)
{
}

MotionClassifier::MotionClassifier(const double fallingVelocityThreshold, const size_t fallingWindowSize,
                                   const double lyingAspectRatioThreshold)
    : fallingVelocityThreshold(fallingVelocityThreshold), fallingWindowSize(fallingWindowSize),
      lyingAspectRatioThreshold(lyingAspectRatioThreshold)
{
}

/// @brief 最初と最後の座標の距離を経過時間で割った速さ。経過時間が 0 なら 0
double MotionClassifier::calcVelocity(const std::vector<TrackPoint> &window)
{
    if (window.size() < 2) return 0.0;

    const TrackPoint &first = window.front();
    const TrackPoint &last = window.back();
    const double timeDiffSec = (last.timestampMillis - first.timestampMillis) / 1000.0;
    if (timeDiffSec <= 0.0) return 0.0;

    const double distance = BboxUtil::Distance(cv::Point2d(first.x, first.y), cv::Point2d(last.x, last.y));
    return distance / timeDiffSec;
}

/// @brief 連続する2点の下向きの速度がひとつでも閾値を超えたら true
bool MotionClassifier::isFallingMotion(const std::vector<TrackPoint> &window) const
{
    for (size_t i = 1; i < window.size(); i++)
    {
        const TrackPoint &prev = window[i - 1];
        const TrackPoint &curr = window[i];
        const double timeDiffSec = (curr.timestampMillis - prev.timestampMillis) / 1000.0;

        // PersonTrack は時刻が増加する座標しか保持しないので通常は起こらない
        if (timeDiffSec <= 0.0) continue;

        const double verticalVelocity = (curr.y - prev.y) / timeDiffSec; // 画像座標なので下向きが正
        if (verticalVelocity > fallingVelocityThreshold)
        {
            return true;
        }
    }
    return false;
}

void MotionClassifier::DetectFalling(std::list<PersonTrack> &tracks, std::vector<FallingPersonEvent> &events) const
{
    for (PersonTrack &track : tracks)
    {
        const std::deque<TrackPoint> &positions = track.Positions();
        if (positions.size() < fallingWindowSize || positions.size() < 2) continue;

        // 直近 fallingWindowSize 点
        const std::vector<TrackPoint> window(positions.end() - (std::ptrdiff_t)fallingWindowSize, positions.end());

        if (!isFallingMotion(window) || track.IsFalling()) continue;

        track.MarkFalling();

        FallingPersonEvent event;
        event.trackId = track.GetId();
        event.position = window.back();
        event.velocity = calcVelocity(window);
        event.severity = Severity::High;
        event.timestampMillis = window.back().timestampMillis;
        events.push_back(event);
    }
}

void MotionClassifier::DetectLying(const FrameObservation &frame, std::vector<LyingPersonEvent> &events) const
{
    for (const Detection &detection : frame.Detections())
    {
        if (!detection.IsPerson()) continue;

        const double aspectRatio = BboxUtil::AspectRatio(detection.bbox);
        if (aspectRatio > lyingAspectRatioThreshold)
        {
            LyingPersonEvent event;
            event.bbox = detection.bbox;
            event.aspectRatio = aspectRatio;
            event.confidence = MathUtil::Clamp(aspectRatio / lyingAspectRatioThreshold, 0.0, 1.0);
            event.severity = Severity::Medium;
            event.timestampMillis = frame.TimestampMillis();
            events.push_back(event);
        }
    }
}
