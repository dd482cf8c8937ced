/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>

#include "Types.hpp"
#include "nlohmann/json.hpp"
#include "pipeline/IncidentExtractor.hpp"

/// @brief 観測と解析結果の JSON 変換
namespace SafetyJson
{
    /// @brief {"frameId", "timestamp", "detections": [{"type", "label", "confidence", "bbox": {...}}]} を読む
    /// bbox のない検出は読み飛ばす。bbox の座標が欠けている検出は NaN のまま返し、解析側で捨てる
    /// @param[out] errorMessage 失敗したときの理由
    bool ParseFrame(const nlohmann::json &j, FrameObservation &frame, std::string &errorMessage);
    bool ParseFrame(const std::string &text, FrameObservation &frame, std::string &errorMessage);

    nlohmann::json BboxToJson(const BboxXyxy &bbox);
    nlohmann::json SurgeToJson(const DensitySurgeEvent &surge);
    nlohmann::json FallingToJson(const FallingPersonEvent &falling);
    nlohmann::json LyingToJson(const LyingPersonEvent &lying);

    nlohmann::json ResultToJson(const std::string &frameId, const int64_t timestampMillis,
                                const SafetyAnalysisResult &result);
    nlohmann::json StatsToJson(const SafetyStats &stats);

    /// @param result incident の元になった解析結果。対応するイベントを detectionData に入れる
    nlohmann::json IncidentToJson(const SafetyIncident &incident, const SafetyAnalysisResult &result);
}
