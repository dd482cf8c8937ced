/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SurgeDetector.hpp"
#include "MathUtil.hpp"
#include <algorithm>

/// @brief セル単位の surge 判定
/// 直前の密度が 0 の場合は増加率が定義できないので、閾値を超えた時点で HIGH とする
bool SurgeDetector::isSurge(const DensityCell &current, const DensityCell &previous, DensitySurgeEvent &surge) const
{
    if (current.density <= densityThreshold)
    {
        return false;
    }

    surge.zone = current;
    surge.currentDensity = current.density;
    surge.previousDensity = previous.density;
    surge.timestampMillis = current.timestampMillis;

    if (previous.density == 0.0)
    {
        surge.isFromEmpty = true;
        surge.increasePercent = 0.0;
        surge.severity = Severity::High;
        return true;
    }

    if (current.density <= previous.density * (1.0 + surgeThreshold))
    {
        return false;
    }

    surge.isFromEmpty = false;
    surge.increasePercent = MathUtil::Round((current.density - previous.density) / previous.density * 100.0, 1);
    surge.severity = current.density > densityThreshold * 2.0 ? Severity::High : Severity::Medium;
    return true;
}

void SurgeDetector::Detect(const std::deque<DensitySnapshot> &history, std::vector<DensitySurgeEvent> &surges) const
{
    if (history.size() < 2)
    {
        return;
    }

    const DensitySnapshot &current = history[history.size() - 1];
    const DensitySnapshot &previous = history[history.size() - 2];

    // セル数が異なる場合は短い方に合わせる
    const size_t numCells = std::min(current.size(), previous.size());
    for (size_t k = 0; k < numCells; k++)
    {
        DensitySurgeEvent surge;
        if (isSurge(current[k], previous[k], surge))
        {
            surges.push_back(surge);
        }
    }
}
