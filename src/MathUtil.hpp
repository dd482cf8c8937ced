/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <algorithm>
#include <cmath>

/// @brief 数学に関連するユーティリティ
namespace MathUtil
{
    template <class T> inline T Clamp(T value, T min, T max) { return std::max(min, std::min(value, max)); }

    /// @brief 小数点以下 digits 桁に丸める (四捨五入)
    inline double Round(const double value, const int digits)
    {
        const double scale = std::pow(10.0, digits);
        return std::round(value * scale) / scale;
    }
}
