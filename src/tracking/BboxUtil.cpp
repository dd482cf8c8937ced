/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "BboxUtil.hpp"
#include <cmath>

/// @brief バウンディングボックスの中心座標を計算する
cv::Point2d BboxUtil::Center(const BboxXyxy &bbox) { return cv::Point2d(bbox.x_center(), bbox.y_center()); }

double BboxUtil::AspectRatio(const BboxXyxy &bbox)
{
    const double h = bbox.height();
    if (h <= 0.0)
    {
        return 0.0;
    }
    return bbox.width() / h;
}

double BboxUtil::Distance(const cv::Point2d &p1, const cv::Point2d &p2)
{
    return std::sqrt(std::pow(p1.x - p2.x, 2) + std::pow(p1.y - p2.y, 2));
}

bool BboxUtil::IsValid(const BboxXyxy &bbox)
{
    if (!std::isfinite(bbox.x0) || !std::isfinite(bbox.y0) || !std::isfinite(bbox.x1) || !std::isfinite(bbox.y1))
    {
        return false;
    }
    return bbox.x0 < bbox.x1 && bbox.y0 < bbox.y1;
}
