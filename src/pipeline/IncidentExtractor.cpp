/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "IncidentExtractor.hpp"

namespace
{
    // 種別ごとの確信度
    const double DENSITY_ALERT_CONFIDENCE = 0.9;
    const double SURGE_CONFIDENCE = 0.8;
    const double FALLING_CONFIDENCE = 0.9;
    const double LYING_CONFIDENCE = 0.8;

    SafetyIncident makeIncident(const IncidentType type, const Severity severity, const double confidence,
                                const std::string &frameId, const int64_t timestampMillis, const size_t eventIndex)
    {
        SafetyIncident incident;
        incident.type = type;
        incident.severity = severity;
        incident.confidence = confidence;
        incident.frameId = frameId;
        incident.timestampMillis = timestampMillis;
        incident.eventIndex = eventIndex;
        return incident;
    }
}

const char *ToString(const IncidentType type)
{
    switch (type)
    {
    case IncidentType::DensityAlert:
        return "DENSITY_ALERT";
    case IncidentType::SurgeDetection:
        return "SURGE_DETECTION";
    case IncidentType::FallingPerson:
        return "FALLING_PERSON";
    case IncidentType::LyingPerson:
        return "LYING_PERSON";
    }
    return "DENSITY_ALERT";
}

void IncidentExtractor::Extract(const std::string &frameId, const int64_t timestampMillis,
                                const SafetyAnalysisResult &result, std::vector<SafetyIncident> &incidents)
{
    // 混雑度は LOW 以外を記録
    if (result.occupancyLevel != OccupancyLevel::Low)
    {
        const Severity severity = result.occupancyLevel == OccupancyLevel::High ? Severity::High : Severity::Medium;
        SafetyIncident incident = makeIncident(IncidentType::DensityAlert, severity, DENSITY_ALERT_CONFIDENCE, frameId,
                                               timestampMillis, 0);
        incident.hasPersonCount = true;
        incident.personCount = result.personCount;
        incidents.push_back(incident);
    }

    for (size_t i = 0; i < result.densitySurges.size(); i++)
    {
        const DensitySurgeEvent &surge = result.densitySurges[i];
        incidents.push_back(makeIncident(IncidentType::SurgeDetection, surge.severity, SURGE_CONFIDENCE, frameId,
                                         surge.timestampMillis, i));
    }

    for (size_t i = 0; i < result.fallingPersons.size(); i++)
    {
        incidents.push_back(makeIncident(IncidentType::FallingPerson, Severity::High, FALLING_CONFIDENCE, frameId,
                                         result.fallingPersons[i].timestampMillis, i));
    }

    for (size_t i = 0; i < result.lyingPersons.size(); i++)
    {
        incidents.push_back(makeIncident(IncidentType::LyingPerson, Severity::Medium, LYING_CONFIDENCE, frameId,
                                         result.lyingPersons[i].timestampMillis, i));
    }
}
