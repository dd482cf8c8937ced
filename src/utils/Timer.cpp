/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Timer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

Timer::Timer(const std::string &name) : name(name), accumulatedSec(0.0), squareSum(0.0), maxSec(0.0), count(0) {}

void Timer::Start() { startTime = std::chrono::steady_clock::now(); }

double Timer::End()
{
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
    const double sec = elapsed.count();
    accumulatedSec += sec;
    squareSum += sec * sec;
    maxSec = std::max(maxSec, sec);
    count++;
    return sec;
}

double Timer::Stdev() const
{
    if (count < 2) return -1.0;

    const double average = accumulatedSec / count;
    const double variance = std::max(0.0, squareSum / count - average * average);

    // 不偏分散に補正する
    return std::sqrt(variance * count / (count - 1.0));
}

void Timer::Reset()
{
    accumulatedSec = 0.0;
    squareSum = 0.0;
    maxSec = 0.0;
    count = 0;
}

std::string Timer::ResultString() const
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "# " << name << " count: " << count << ", Accumulated: " << accumulatedSec << " [sec], Average: "
        << Average() * 1000 << " [msec], Max: " << maxSec * 1000 << " [msec]";
    if (count >= 2)
    {
        oss << ", Stdev: " << Stdev() * 1000 << " [msec]";
    }
    return oss.str();
}
