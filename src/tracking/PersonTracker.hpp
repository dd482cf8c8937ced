/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <list>
#include <vector>

#include "BboxUtil.hpp"
#include "LinearSumAssignment.hpp"
#include "PersonTrack.hpp"

/// @brief 最近傍の中心座標で人物の検出をフレーム間で対応付け、トラックIDを維持する
class PersonTracker
{
private:
    std::list<PersonTrack> tracks; // 生成順

    unsigned int currId; // 次に割り当てるID。Reset しても戻さない

    int64_t trackTimeoutMillis;      // この時間を超えて観測されないトラックは削除
    int64_t positionRetentionMillis; // 中心座標の保持期間
    double maxMatchDistance;         // これ未満の距離のトラックにのみ対応付ける (正規化座標)
    AssociationMode associationMode;
    uint64_t rejectedPositionCount; // 時刻が逆行していて反映しなかった観測の数

    void cleanTracks(const int64_t nowMillis);
    void addTrack(const cv::Point2d &center, const int64_t nowMillis);
    void updateTrack(PersonTrack &track, const cv::Point2d &center, const int64_t nowMillis);
    std::list<PersonTrack>::iterator findNearestTrack(const cv::Point2d &center);
    void associateGreedy(const std::vector<cv::Point2d> &centers, const int64_t nowMillis);
    void associateHungarian(const std::vector<cv::Point2d> &centers, const int64_t nowMillis);

public:
    PersonTracker();
    PersonTracker(const int64_t trackTimeoutMillis, const int64_t positionRetentionMillis, const double maxMatchDistance,
                  const AssociationMode associationMode);
    ~PersonTracker(){};

    size_t ActiveTrackCount() const { return tracks.size(); }
    uint64_t RejectedPositionCount() const { return rejectedPositionCount; }
    const std::list<PersonTrack> &Tracks() const { return tracks; }
    std::list<PersonTrack> &Tracks() { return tracks; }

    void Reset();

    /// @brief 古いトラックを削除してから、フレーム内の人物の検出をトラックに対応付ける
    /// @param frame bbox が検証済みの観測
    void Update(const FrameObservation &frame);
};
