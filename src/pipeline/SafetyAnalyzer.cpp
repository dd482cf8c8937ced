/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SafetyAnalyzer.hpp"
#include "SafetyStatusAggregator.hpp"
#include "tracking/BboxUtil.hpp"
#include "utils/ConfigUtil.hpp"
#include <stdexcept>

namespace
{
    const AnalyzerConfig &validated(const AnalyzerConfig &config)
    {
        std::string errorMessage;
        if (!ConfigUtil::ValidateAnalyzerConfig(config, errorMessage))
        {
            throw std::invalid_argument("Invalid analyzer config: " + errorMessage);
        }
        return config;
    }
}

SafetyAnalyzer::SafetyAnalyzer() : SafetyAnalyzer(AnalyzerConfig()) {}

SafetyAnalyzer::SafetyAnalyzer(const AnalyzerConfig &config)
    : config(validated(config)), frameHistory(config.maxFrameHistory), densityHistory(config.maxFrameHistory),
      personTracker(config.trackTimeoutMillis, config.positionRetentionMillis, config.maxMatchDistance,
                    config.associationMode),
      densityGridAnalyzer(config.densityGridSize), surgeDetector(config.densityThreshold, config.surgeThreshold),
      motionClassifier(config.fallingVelocityThreshold, config.fallingWindowSize, config.lyingAspectRatioThreshold),
      processedFrameCount(0), droppedDetectionCount(0)
{
}

/// @brief bbox が不正な検出を取り除いた観測を作る
FrameObservation SafetyAnalyzer::sanitize(const FrameObservation &frame, size_t &numDropped)
{
    numDropped = 0;
    std::vector<Detection> valid;
    valid.reserve(frame.Detections().size());
    for (const Detection &detection : frame.Detections())
    {
        if (BboxUtil::IsValid(detection.bbox))
        {
            valid.push_back(detection);
        }
        else
        {
            numDropped++;
        }
    }
    return FrameObservation(frame.FrameId(), frame.TimestampMillis(), valid);
}

void SafetyAnalyzer::ProcessFrame(const FrameObservation &frame, SafetyAnalysisResult &result)
{
    std::lock_guard<std::mutex> lock(mu);

    result.Clear();

    size_t numDropped = 0;
    const FrameObservation observation = sanitize(frame, numDropped);
    droppedDetectionCount += numDropped;

    frameHistory.Push(observation);

    // 追跡
    personTracker.Update(observation);

    // 密度
    DensitySnapshot cells;
    densityGridAnalyzer.Analyze(observation, cells);
    densityHistory.Push(cells);
    surgeDetector.Detect(densityHistory.Items(), result.densitySurges);

    // 転倒、横たわり
    motionClassifier.DetectFalling(personTracker.Tracks(), result.fallingPersons);
    motionClassifier.DetectLying(observation, result.lyingPersons);

    result.overallSafetyStatus =
        SafetyStatusAggregator::Aggregate(result.densitySurges, result.fallingPersons, result.lyingPersons);

    for (const Detection &detection : observation.Detections())
    {
        if (detection.IsPerson()) result.personCount++;
    }
    result.occupancyLevel = SafetyStatusAggregator::ClassifyOccupancy(result.personCount, config.occupancyMediumCount,
                                                                      config.occupancyHighCount);

    processedFrameCount++;
}

SafetyStats SafetyAnalyzer::GetStats() const
{
    std::lock_guard<std::mutex> lock(mu);

    SafetyStats stats;
    stats.activeTrackCount = personTracker.ActiveTrackCount();
    stats.frameHistoryLength = frameHistory.Size();
    stats.densityZoneCount = densityHistory.Empty() ? 0 : densityHistory.Latest().size();
    if (!frameHistory.Empty())
    {
        stats.hasLastAnalysis = true;
        stats.lastAnalysisTimestamp = frameHistory.Latest().TimestampMillis();
    }
    stats.processedFrameCount = processedFrameCount;
    stats.droppedDetectionCount = droppedDetectionCount;
    return stats;
}

void SafetyAnalyzer::Reset()
{
    std::lock_guard<std::mutex> lock(mu);

    frameHistory.Clear();
    densityHistory.Clear();
    personTracker.Reset();
    processedFrameCount = 0;
    droppedDetectionCount = 0;
}
