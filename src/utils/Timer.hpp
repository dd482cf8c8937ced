/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#pragma once

#include <chrono>
#include <string>

/// @brief レイテンシ測定のためのタイマークラスです。Start() と End() で挟まれたコードの実行時間を計測します。
/// 平均、標準偏差、最大、合計を取得できます。
class Timer
{
private:
    std::string name;

    std::chrono::steady_clock::time_point startTime;
    double accumulatedSec;
    double squareSum;
    double maxSec;
    unsigned int count;

public:
    explicit Timer(const std::string &name = "Timer");
    void Start();

    /// @retval 今回の経過時間 [sec]
    double End();

    unsigned int Count() const { return count; }
    double Accumulated() const { return accumulatedSec; }
    double Average() const { return count > 0 ? accumulatedSec / count : 0.0; }
    double Max() const { return maxSec; }

    /// @brief 標本から推定した母集団の標準偏差。標本が2つ未満なら -1.0
    double Stdev() const;

    void Reset();
    std::string ResultString() const;
};
