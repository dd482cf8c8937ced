/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "ConfigUtil.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace
{
    template <class T> void readValue(const json &j, const char *key, T &value)
    {
        if (j.contains(key))
        {
            value = j.at(key).get<T>(); // 型が違えば json::type_error
        }
    }

    bool parseAssociationMode(const std::string &text, AssociationMode &mode)
    {
        if (text == "greedy")
        {
            mode = AssociationMode::Greedy;
            return true;
        }
        if (text == "hungarian")
        {
            mode = AssociationMode::Hungarian;
            return true;
        }
        return false;
    }
}

bool ConfigUtil::ValidateAnalyzerConfig(const AnalyzerConfig &config, std::string &errorMessage)
{
    if (config.maxFrameHistory < 2)
    {
        errorMessage = "maxFrameHistory must be 2 or more";
        return false;
    }
    if (config.densityGridSize <= 0)
    {
        errorMessage = "densityGridSize must be positive";
        return false;
    }
    if (config.densityThreshold < 0.0 || config.surgeThreshold < 0.0)
    {
        errorMessage = "densityThreshold and surgeThreshold must not be negative";
        return false;
    }
    if (config.fallingWindowSize < 2)
    {
        errorMessage = "fallingWindowSize must be 2 or more";
        return false;
    }
    if (config.fallingVelocityThreshold <= 0.0 || config.lyingAspectRatioThreshold <= 0.0)
    {
        errorMessage = "fallingVelocityThreshold and lyingAspectRatioThreshold must be positive";
        return false;
    }
    if (config.trackTimeoutMillis <= 0 || config.positionRetentionMillis <= 0)
    {
        errorMessage = "trackTimeoutMillis and positionRetentionMillis must be positive";
        return false;
    }
    if (config.maxMatchDistance <= 0.0)
    {
        errorMessage = "maxMatchDistance must be positive";
        return false;
    }
    if (config.occupancyMediumCount < 0 || config.occupancyHighCount < config.occupancyMediumCount)
    {
        errorMessage = "occupancyHighCount must not be less than occupancyMediumCount";
        return false;
    }
    return true;
}

bool ConfigUtil::ParseAnalyzerConfig(const json &j, AnalyzerConfig &config, std::string &errorMessage)
{
    if (!j.is_object())
    {
        errorMessage = "config is not a JSON object";
        return false;
    }

    // 整数のキーに小数を与えると get<int>() で切り捨てられるので先に確認する
    for (const char *key : {"maxFrameHistory", "fallingWindowSize", "densityGridSize", "trackTimeoutMillis",
                            "positionRetentionMillis", "occupancyMediumCount", "occupancyHighCount"})
    {
        if (j.contains(key) && !j.at(key).is_number_integer())
        {
            errorMessage = std::string(key) + " must be an integer";
            return false;
        }
    }

    // 負の値が size_t に変換されないようにする
    for (const char *key : {"maxFrameHistory", "fallingWindowSize"})
    {
        if (j.contains(key) && !j.at(key).is_number_unsigned() && j.at(key).get<int64_t>() < 0)
        {
            errorMessage = std::string(key) + " must be a non-negative integer";
            return false;
        }
    }

    AnalyzerConfig parsed = config;
    try
    {
        readValue(j, "maxFrameHistory", parsed.maxFrameHistory);
        readValue(j, "densityGridSize", parsed.densityGridSize);
        readValue(j, "densityThreshold", parsed.densityThreshold);
        readValue(j, "surgeThreshold", parsed.surgeThreshold);
        readValue(j, "fallingVelocityThreshold", parsed.fallingVelocityThreshold);
        readValue(j, "fallingWindowSize", parsed.fallingWindowSize);
        readValue(j, "lyingAspectRatioThreshold", parsed.lyingAspectRatioThreshold);
        readValue(j, "trackTimeoutMillis", parsed.trackTimeoutMillis);
        readValue(j, "positionRetentionMillis", parsed.positionRetentionMillis);
        readValue(j, "maxMatchDistance", parsed.maxMatchDistance);
        readValue(j, "occupancyMediumCount", parsed.occupancyMediumCount);
        readValue(j, "occupancyHighCount", parsed.occupancyHighCount);

        if (j.contains("associationMode"))
        {
            const std::string mode = j.at("associationMode").get<std::string>();
            if (!parseAssociationMode(mode, parsed.associationMode))
            {
                errorMessage = "unknown associationMode: " + mode;
                return false;
            }
        }
    }
    catch (const json::exception &e)
    {
        errorMessage = e.what();
        return false;
    }

    if (!ValidateAnalyzerConfig(parsed, errorMessage))
    {
        return false;
    }

    config = parsed;
    return true;
}

bool ConfigUtil::LoadAnalyzerConfig(const std::string &path, AnalyzerConfig &config)
{
    std::ifstream ifs(path);
    if (!ifs)
    {
        std::cout << "Couldn't open config file: " << path << std::endl;
        return false;
    }

    json j;
    try
    {
        ifs >> j;
    }
    catch (const json::parse_error &e)
    {
        std::cout << "Couldn't parse config file: " << path << " (" << e.what() << ")" << std::endl;
        return false;
    }

    std::string errorMessage;
    if (!ParseAnalyzerConfig(j, config, errorMessage))
    {
        std::cout << "Invalid config " << path << ": " << errorMessage << std::endl;
        return false;
    }
    return true;
}
