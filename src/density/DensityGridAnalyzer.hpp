/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include "Types.hpp"

/// @brief 画面を gridSize x gridSize のセルに分割し、セルごとの人物の密度を計算する
class DensityGridAnalyzer
{
private:
    int gridSize;

public:
    DensityGridAnalyzer() : gridSize(8){};
    explicit DensityGridAnalyzer(const int gridSize) : gridSize(gridSize){};
    ~DensityGridAnalyzer(){};

    /// @brief 中心がセル [x, x + w) x [y, y + h) に入る人物の数から密度を計算する
    /// @param frame 観測
    /// @param[out] cells (i, j) の row-major 順の gridSize * gridSize 個のセル。i は x 方向
    void Analyze(const FrameObservation &frame, DensitySnapshot &cells) const;
};
