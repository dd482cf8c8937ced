/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SafetyJson.hpp"
#include "MathUtil.hpp"
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace
{
    const char *PERSON_TYPE = "PERSON_DETECTION";
    const char *PERSON_LABEL = "Person";

    double numberOrNan(const json &j, const char *key)
    {
        if (!j.contains(key) || !j[key].is_number())
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return j[key].get<double>();
    }

    std::string stringOrEmpty(const json &j, const char *key)
    {
        if (!j.contains(key)) return "";
        const json &v = j[key];
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        return "";
    }

    bool parseDetection(const json &j, Detection &detection)
    {
        if (!j.is_object() || !j.contains("bbox") || !j["bbox"].is_object())
        {
            return false;
        }

        const json &bbox = j["bbox"];
        detection.bbox.x0 = numberOrNan(bbox, "left");
        detection.bbox.y0 = numberOrNan(bbox, "top");
        detection.bbox.x1 = numberOrNan(bbox, "right");
        detection.bbox.y1 = numberOrNan(bbox, "bottom");
        detection.bbox.confidence = j.contains("confidence") && j["confidence"].is_number() ? j["confidence"].get<double>() : 0.0;

        const std::string type = stringOrEmpty(j, "type");
        detection.label = stringOrEmpty(j, "label");
        detection.kind = (type == PERSON_TYPE || detection.label == PERSON_LABEL) ? DetectionKind::Person : DetectionKind::Other;
        return true;
    }

    json pointToJson(const TrackPoint &point)
    {
        return json{{"x", point.x}, {"y", point.y}, {"timestamp", point.timestampMillis}};
    }

    json eventToJson(const SafetyIncident &incident, const SafetyAnalysisResult &result)
    {
        switch (incident.type)
        {
        case IncidentType::SurgeDetection:
            if (incident.eventIndex < result.densitySurges.size())
                return SafetyJson::SurgeToJson(result.densitySurges[incident.eventIndex]);
            break;
        case IncidentType::FallingPerson:
            if (incident.eventIndex < result.fallingPersons.size())
                return SafetyJson::FallingToJson(result.fallingPersons[incident.eventIndex]);
            break;
        case IncidentType::LyingPerson:
            if (incident.eventIndex < result.lyingPersons.size())
                return SafetyJson::LyingToJson(result.lyingPersons[incident.eventIndex]);
            break;
        case IncidentType::DensityAlert:
            return json{{"personCount", result.personCount},
                        {"densityLevel", ToString(result.occupancyLevel)},
                        {"alertType", "OCCUPANCY_DENSITY"}};
        }
        return nullptr;
    }
}

bool SafetyJson::ParseFrame(const json &j, FrameObservation &frame, std::string &errorMessage)
{
    if (!j.is_object())
    {
        errorMessage = "frame is not a JSON object";
        return false;
    }

    int64_t timestampMillis = 0;
    if (j.contains("timestamp") && j["timestamp"].is_number_integer())
    {
        timestampMillis = j["timestamp"].get<int64_t>();
    }
    else if (j.contains("timestamp") && j["timestamp"].is_number_float())
    {
        timestampMillis = (int64_t)std::llround(j["timestamp"].get<double>());
    }
    else
    {
        errorMessage = "missing or non-numeric \"timestamp\"";
        return false;
    }

    std::vector<Detection> detections;
    if (j.contains("detections"))
    {
        const json &jDetections = j["detections"];
        if (!jDetections.is_array())
        {
            errorMessage = "\"detections\" is not an array";
            return false;
        }
        for (const json &jDetection : jDetections)
        {
            Detection detection;
            if (parseDetection(jDetection, detection))
            {
                detections.push_back(detection);
            }
        }
    }

    frame = FrameObservation(stringOrEmpty(j, "frameId"), timestampMillis, detections);
    return true;
}

bool SafetyJson::ParseFrame(const std::string &text, FrameObservation &frame, std::string &errorMessage)
{
    try
    {
        const json j = json::parse(text);
        return ParseFrame(j, frame, errorMessage);
    }
    catch (const json::exception &e)
    {
        errorMessage = e.what();
        return false;
    }
}

json SafetyJson::BboxToJson(const BboxXyxy &bbox)
{
    return json{{"left", bbox.x0}, {"top", bbox.y0}, {"right", bbox.x1}, {"bottom", bbox.y1}};
}

json SafetyJson::SurgeToJson(const DensitySurgeEvent &surge)
{
    json j;
    j["type"] = "DENSITY_SURGE";
    j["zone"] = {{"x", surge.zone.x}, {"y", surge.zone.y}, {"width", surge.zone.width}, {"height", surge.zone.height}};
    j["currentDensity"] = surge.currentDensity;
    j["previousDensity"] = surge.previousDensity;
    if (surge.isFromEmpty)
        j["increase"] = nullptr; // 直前が 0 なので増加率は定義できない
    else
        j["increase"] = surge.increasePercent;
    j["severity"] = ToString(surge.severity);
    j["timestamp"] = surge.timestampMillis;
    return j;
}

json SafetyJson::FallingToJson(const FallingPersonEvent &falling)
{
    json j;
    j["type"] = "FALLING_PERSON";
    j["trackerId"] = falling.trackId;
    j["position"] = pointToJson(falling.position);
    j["velocity"] = falling.velocity;
    j["severity"] = ToString(falling.severity);
    j["timestamp"] = falling.timestampMillis;
    return j;
}

json SafetyJson::LyingToJson(const LyingPersonEvent &lying)
{
    json j;
    j["type"] = "LYING_PERSON";
    j["bbox"] = BboxToJson(lying.bbox);
    j["aspectRatio"] = MathUtil::Round(lying.aspectRatio, 2);
    j["confidence"] = lying.confidence;
    j["severity"] = ToString(lying.severity);
    j["timestamp"] = lying.timestampMillis;
    return j;
}

json SafetyJson::ResultToJson(const std::string &frameId, const int64_t timestampMillis, const SafetyAnalysisResult &result)
{
    json j;
    j["frameId"] = frameId;
    j["timestamp"] = timestampMillis;
    j["overallSafetyStatus"] = ToString(result.overallSafetyStatus);
    j["personCount"] = result.personCount;
    j["occupancyLevel"] = ToString(result.occupancyLevel);

    j["densitySurges"] = json::array();
    for (const DensitySurgeEvent &surge : result.densitySurges)
    {
        j["densitySurges"].push_back(SurgeToJson(surge));
    }
    j["fallingPersons"] = json::array();
    for (const FallingPersonEvent &falling : result.fallingPersons)
    {
        j["fallingPersons"].push_back(FallingToJson(falling));
    }
    j["lyingPersons"] = json::array();
    for (const LyingPersonEvent &lying : result.lyingPersons)
    {
        j["lyingPersons"].push_back(LyingToJson(lying));
    }
    return j;
}

json SafetyJson::StatsToJson(const SafetyStats &stats)
{
    json j;
    j["activePersonTrackers"] = stats.activeTrackCount;
    j["frameHistoryLength"] = stats.frameHistoryLength;
    j["densityZones"] = stats.densityZoneCount;
    if (stats.hasLastAnalysis)
        j["lastAnalysisTime"] = stats.lastAnalysisTimestamp;
    else
        j["lastAnalysisTime"] = nullptr;
    j["processedFrames"] = stats.processedFrameCount;
    j["droppedDetections"] = stats.droppedDetectionCount;
    return j;
}

json SafetyJson::IncidentToJson(const SafetyIncident &incident, const SafetyAnalysisResult &result)
{
    json j;
    j["incidentType"] = ToString(incident.type);
    j["severity"] = ToString(incident.severity);
    j["confidence"] = incident.confidence;
    j["frameId"] = incident.frameId;
    j["timestamp"] = incident.timestampMillis;
    if (incident.hasPersonCount)
        j["personCount"] = incident.personCount;
    else
        j["personCount"] = nullptr;
    j["detectionData"] = eventToJson(incident, result);
    return j;
}
