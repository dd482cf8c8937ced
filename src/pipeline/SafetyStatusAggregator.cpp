/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SafetyStatusAggregator.hpp"

SafetyStatus SafetyStatusAggregator::Aggregate(const std::vector<DensitySurgeEvent> &surges,
                                               const std::vector<FallingPersonEvent> &falls,
                                               const std::vector<LyingPersonEvent> &lies)
{
    int numHigh = 0;
    int numMedium = 0;

    for (const DensitySurgeEvent &surge : surges)
    {
        if (surge.severity == Severity::High)
            numHigh++;
        else
            numMedium++;
    }
    for (const FallingPersonEvent &fall : falls)
    {
        if (fall.severity == Severity::High) numHigh++;
    }
    for (const LyingPersonEvent &lie : lies)
    {
        if (lie.severity == Severity::Medium) numMedium++;
    }

    if (numHigh > 0)
    {
        return SafetyStatus::Critical;
    }
    else if (numMedium > 1)
    {
        return SafetyStatus::Warning;
    }
    else
    {
        return SafetyStatus::Safe;
    }
}

OccupancyLevel SafetyStatusAggregator::ClassifyOccupancy(const int personCount, const int mediumCount, const int highCount)
{
    if (personCount > highCount) return OccupancyLevel::High;
    if (personCount > mediumCount) return OccupancyLevel::Medium;
    return OccupancyLevel::Low;
}
