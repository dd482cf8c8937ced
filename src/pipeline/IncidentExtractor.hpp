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
#include <vector>

#include "Types.hpp"

enum class IncidentType
{
    DensityAlert,
    SurgeDetection,
    FallingPerson,
    LyingPerson
};

/// @brief 外部のインシデント記録に渡すレコード
struct SafetyIncident
{
    IncidentType type;
    Severity severity;
    double confidence;
    std::string frameId;
    int64_t timestampMillis;
    bool hasPersonCount; // DensityAlert のみ true
    int personCount;
    size_t eventIndex; // 解析結果の対応するイベントのリスト内の位置

    SafetyIncident()
        : type(IncidentType::DensityAlert), severity(Severity::Medium), confidence(0.0), timestampMillis(0),
          hasPersonCount(false), personCount(0), eventIndex(0){};
};

const char *ToString(const IncidentType type);

/// @brief 解析結果のうち記録すべきもの (MEDIUM 以上) をインシデントに変換する
namespace IncidentExtractor
{
    void Extract(const std::string &frameId, const int64_t timestampMillis, const SafetyAnalysisResult &result,
                 std::vector<SafetyIncident> &incidents);
}
