/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <mutex>

#include "Types.hpp"
#include "density/DensityGridAnalyzer.hpp"
#include "density/SurgeDetector.hpp"
#include "posture/MotionClassifier.hpp"
#include "tracking/PersonTracker.hpp"
#include "utils/FrameHistory.hpp"

/// @brief 1つの映像ストリームの検出結果をフレームごとに受け取り、人物の追跡、密度の急増の検出、
/// 転倒と横たわりの判定を行い、安全状態を返すクラス。ストリームごとにインスタンスを作る。
class SafetyAnalyzer
{
private:
    AnalyzerConfig config;

    FrameHistory<FrameObservation> frameHistory;
    FrameHistory<DensitySnapshot> densityHistory;
    PersonTracker personTracker;
    DensityGridAnalyzer densityGridAnalyzer;
    SurgeDetector surgeDetector;
    MotionClassifier motionClassifier;

    uint64_t processedFrameCount;
    uint64_t droppedDetectionCount;

    // ProcessFrame はトラックと履歴を読み書きするので1フレームずつ処理する
    mutable std::mutex mu;

    static FrameObservation sanitize(const FrameObservation &frame, size_t &numDropped);

public:
    SafetyAnalyzer();

    /// @param config 解析パラメータ。ConfigUtil::ValidateAnalyzerConfig を通らなければ std::invalid_argument
    explicit SafetyAnalyzer(const AnalyzerConfig &config);
    ~SafetyAnalyzer(){};

    const AnalyzerConfig &GetConfig() const { return config; }

    /// @brief 1フレームを解析する
    /// @param frame 観測。bbox が不正な検出は捨てて残りで解析する
    /// @param[out] result 解析結果
    void ProcessFrame(const FrameObservation &frame, SafetyAnalysisResult &result);

    /// @brief 現在の状態の統計。状態は変更しない
    SafetyStats GetStats() const;

    /// @brief トラックと履歴を消去する。トラックIDは引き続き増加する
    void Reset();
};
