/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <opencv2/core.hpp>

#include "Types.hpp"

/// @brief Bboxに関連するユーティリティ関数を提供します。座標はすべて正規化座標。
namespace BboxUtil
{
    cv::Point2d Center(const BboxXyxy &bbox);

    /// @brief 幅 / 高さ。高さが 0 以下のときは 0 を返す
    double AspectRatio(const BboxXyxy &bbox);

    double Distance(const cv::Point2d &p1, const cv::Point2d &p2);

    /// @brief 座標が有限で x0 < x1 かつ y0 < y1 のとき true
    bool IsValid(const BboxXyxy &bbox);
}
