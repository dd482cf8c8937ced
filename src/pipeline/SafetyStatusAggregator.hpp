/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <vector>

#include "Types.hpp"

/// @brief フレームのイベントから全体の安全状態を決める
namespace SafetyStatusAggregator
{
    /// @brief HIGH の surge か転倒があれば CRITICAL、MEDIUM の surge と横たわりの合計が 2 以上なら WARNING
    SafetyStatus Aggregate(const std::vector<DensitySurgeEvent> &surges, const std::vector<FallingPersonEvent> &falls,
                           const std::vector<LyingPersonEvent> &lies);

    /// @brief 人数から混雑度を決める
    OccupancyLevel ClassifyOccupancy(const int personCount, const int mediumCount, const int highCount);
}
