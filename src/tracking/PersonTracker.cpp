/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "PersonTracker.hpp"
#include <limits>

namespace
{
    // ゲート外の組に与えるコスト。距離は高々 sqrt(2) 程度なので十分大きい
    const double GATED_COST = 1.0e6;
}

PersonTracker::PersonTracker()
    : currId(1), trackTimeoutMillis(3000), positionRetentionMillis(5000), maxMatchDistance(0.2),
      associationMode(AssociationMode::Greedy), rejectedPositionCount(0)
{
}

PersonTracker::PersonTracker(const int64_t trackTimeoutMillis, const int64_t positionRetentionMillis,
                             const double maxMatchDistance, const AssociationMode associationMode)
    : currId(1), trackTimeoutMillis(trackTimeoutMillis), positionRetentionMillis(positionRetentionMillis),
      maxMatchDistance(maxMatchDistance), associationMode(associationMode), rejectedPositionCount(0)
{
}

void PersonTracker::Reset()
{
    tracks.clear();
    rejectedPositionCount = 0;
}

/// @brief trackTimeoutMillis を超えて観測されていないトラックを削除する
void PersonTracker::cleanTracks(const int64_t nowMillis)
{
    for (auto trackItr = tracks.begin(); trackItr != tracks.end();)
    {
        if (trackItr->IsStale(nowMillis, trackTimeoutMillis))
        {
            trackItr = tracks.erase(trackItr);
        }
        else
        {
            trackItr++;
        }
    }
}

void PersonTracker::addTrack(const cv::Point2d &center, const int64_t nowMillis)
{
    tracks.push_back(PersonTrack(currId, TrackPoint(center.x, center.y, nowMillis)));
    currId++;
}

void PersonTracker::updateTrack(PersonTrack &track, const cv::Point2d &center, const int64_t nowMillis)
{
    if (!track.Update(TrackPoint(center.x, center.y, nowMillis), positionRetentionMillis))
    {
        rejectedPositionCount++;
    }
}

/// @brief 最新の座標が center に最も近いトラックを探す。maxMatchDistance 以上離れたトラックは対象外
/// @retval 見つからなければ tracks.end()。距離が同じ場合は先に生成されたトラック
std::list<PersonTrack>::iterator PersonTracker::findNearestTrack(const cv::Point2d &center)
{
    auto nearest = tracks.end();
    double minDistance = std::numeric_limits<double>::infinity();
    for (auto trackItr = tracks.begin(); trackItr != tracks.end(); trackItr++)
    {
        if (trackItr->Positions().empty()) continue;

        const TrackPoint &last = trackItr->LastPosition();
        const double distance = BboxUtil::Distance(center, cv::Point2d(last.x, last.y));
        if (distance < minDistance && distance < maxMatchDistance)
        {
            minDistance = distance;
            nearest = trackItr;
        }
    }
    return nearest;
}

/// @brief 検出ごとに独立して最近傍のトラックを割り当てる
/// 同じフレームの複数の検出が同じトラックに割り当たることがある
void PersonTracker::associateGreedy(const std::vector<cv::Point2d> &centers, const int64_t nowMillis)
{
    for (const cv::Point2d &center : centers)
    {
        auto trackItr = findNearestTrack(center);
        if (trackItr != tracks.end())
        {
            updateTrack(*trackItr, center, nowMillis);
        }
        else
        {
            addTrack(center, nowMillis);
        }
    }
}

/// @brief 検出とトラックの距離行列で線形割当を行う。1つのトラックには高々1つの検出
void PersonTracker::associateHungarian(const std::vector<cv::Point2d> &centers, const int64_t nowMillis)
{
    // このフレームで生成するトラックは割当の対象にしない
    std::vector<std::list<PersonTrack>::iterator> candidates;
    for (auto trackItr = tracks.begin(); trackItr != tracks.end(); trackItr++)
    {
        if (!trackItr->Positions().empty()) candidates.push_back(trackItr);
    }

    std::vector<bool> isMatched(centers.size(), false);
    if (!centers.empty() && !candidates.empty())
    {
        // 距離行列 (行: 検出, 列: トラック)
        cv::Mat distanceMatrix((int)centers.size(), (int)candidates.size(), CV_64F);
        cv::Mat costMatrix((int)centers.size(), (int)candidates.size(), CV_64F);
        for (int d = 0; d < (int)centers.size(); d++)
        {
            for (int t = 0; t < (int)candidates.size(); t++)
            {
                const TrackPoint &last = candidates[t]->LastPosition();
                const double distance = BboxUtil::Distance(centers[d], cv::Point2d(last.x, last.y));
                distanceMatrix.at<double>(d, t) = distance;
                costMatrix.at<double>(d, t) = distance < maxMatchDistance ? distance : GATED_COST;
            }
        }

        std::list<RowCol> associations;
        LinearSumAssignment lsa(costMatrix);
        lsa.ComputeAssociation(associations);

        // ゲート外の割当は捨てる
        for (const RowCol &matchedIndex : associations)
        {
            if (distanceMatrix.at<double>(matchedIndex.row, matchedIndex.col) >= maxMatchDistance) continue;

            updateTrack(*candidates[matchedIndex.col], centers[matchedIndex.row], nowMillis);
            isMatched[matchedIndex.row] = true;
        }
    }

    // 割り当たらなかった検出は新しいトラックにする
    for (size_t d = 0; d < centers.size(); d++)
    {
        if (!isMatched[d]) addTrack(centers[d], nowMillis);
    }
}

void PersonTracker::Update(const FrameObservation &frame)
{
    const int64_t nowMillis = frame.TimestampMillis();

    cleanTracks(nowMillis);

    std::vector<cv::Point2d> centers;
    for (const Detection &detection : frame.Detections())
    {
        if (!detection.IsPerson()) continue;
        centers.push_back(BboxUtil::Center(detection.bbox));
    }

    if (associationMode == AssociationMode::Hungarian)
    {
        associateHungarian(centers, nowMillis);
    }
    else
    {
        associateGreedy(centers, nowMillis);
    }
}
