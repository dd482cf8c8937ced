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

#include "Types.hpp"
#include "tracking/PersonTrack.hpp"

/// @brief トラックの動きから転倒を、検出の bbox の形状から横たわっている人物を判定する
class MotionClassifier
{
private:
    double fallingVelocityThreshold;  // 下向きの速度の閾値 [正規化座標/秒]
    size_t fallingWindowSize;         // 直近何点の座標を見るか
    double lyingAspectRatioThreshold; // 幅 / 高さ がこれを超えたら横たわっているとみなす

    static double calcVelocity(const std::vector<TrackPoint> &window);
    bool isFallingMotion(const std::vector<TrackPoint> &window) const;

public:
    MotionClassifier();
    MotionClassifier(const double fallingVelocityThreshold, const size_t fallingWindowSize,
                     const double lyingAspectRatioThreshold);
    ~MotionClassifier(){};

    /// @brief 転倒を検出したトラックには転倒フラグを立てる。フラグが立っているトラックは再検出しない
    /// @param tracks トラック (転倒フラグを更新する)
    /// @param[out] events 今回新たに転倒と判定したトラック
    void DetectFalling(std::list<PersonTrack> &tracks, std::vector<FallingPersonEvent> &events) const;

    /// @brief フレーム内の人物の検出ごとに判定する。トラッキングは使わない
    void DetectLying(const FrameObservation &frame, std::vector<LyingPersonEvent> &events) const;
};
