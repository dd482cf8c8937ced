/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <deque>
#include <vector>

#include "Types.hpp"

/// @brief 直近2フレームの密度グリッドを比較し、密度の急増 (surge) を検出する
class SurgeDetector
{
private:
    double densityThreshold; // この密度を超えたセルのみ対象
    double surgeThreshold;   // 直前の密度に対する増加率 (0.5 なら 50% 増)

    bool isSurge(const DensityCell &current, const DensityCell &previous, DensitySurgeEvent &surge) const;

public:
    SurgeDetector() : densityThreshold(0.15), surgeThreshold(0.5){};
    SurgeDetector(const double densityThreshold, const double surgeThreshold)
        : densityThreshold(densityThreshold), surgeThreshold(surgeThreshold){};
    ~SurgeDetector(){};

    /// @param history 古い順の密度グリッド。2つ未満なら何も検出しない
    /// @param[out] surges 検出した surge。セルの順
    void Detect(const std::deque<DensitySnapshot> &history, std::vector<DensitySurgeEvent> &surges) const;
};
