/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "SafetyAnalyzerRegistry.hpp"
#include "utils/ConfigUtil.hpp"
#include <stdexcept>

SafetyAnalyzerRegistry::SafetyAnalyzerRegistry(const AnalyzerConfig &config) : config(config)
{
    std::string errorMessage;
    if (!ConfigUtil::ValidateAnalyzerConfig(config, errorMessage))
    {
        throw std::invalid_argument("Invalid analyzer config: " + errorMessage);
    }
}

std::shared_ptr<SafetyAnalyzer> SafetyAnalyzerRegistry::GetOrCreate(const std::string &streamId)
{
    std::lock_guard<std::mutex> lock(mu);
    auto itr = analyzers.find(streamId);
    if (itr != analyzers.end())
    {
        return itr->second;
    }
    std::shared_ptr<SafetyAnalyzer> analyzer = std::make_shared<SafetyAnalyzer>(config);
    analyzers[streamId] = analyzer;
    return analyzer;
}

std::shared_ptr<SafetyAnalyzer> SafetyAnalyzerRegistry::Find(const std::string &streamId) const
{
    std::lock_guard<std::mutex> lock(mu);
    auto itr = analyzers.find(streamId);
    if (itr == analyzers.end())
    {
        return nullptr;
    }
    return itr->second;
}

// 取得済みの shared_ptr はそのまま使える
bool SafetyAnalyzerRegistry::Remove(const std::string &streamId)
{
    std::lock_guard<std::mutex> lock(mu);
    return analyzers.erase(streamId) > 0;
}

std::vector<std::string> SafetyAnalyzerRegistry::StreamIds() const
{
    std::lock_guard<std::mutex> lock(mu);
    std::vector<std::string> ids;
    for (const auto &kv : analyzers)
    {
        ids.push_back(kv.first);
    }
    return ids;
}

size_t SafetyAnalyzerRegistry::Size() const
{
    std::lock_guard<std::mutex> lock(mu);
    return analyzers.size();
}
