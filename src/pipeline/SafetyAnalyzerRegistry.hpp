/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "SafetyAnalyzer.hpp"

/// @brief ストリームIDごとに SafetyAnalyzer を保持する。異なるストリームの解析は並列に実行できる
class SafetyAnalyzerRegistry
{
private:
    AnalyzerConfig config;
    std::map<std::string, std::shared_ptr<SafetyAnalyzer>> analyzers;
    mutable std::mutex mu;

public:
    SafetyAnalyzerRegistry() {}
    /// @param config 各ストリームの解析パラメータ。不正なら std::invalid_argument
    explicit SafetyAnalyzerRegistry(const AnalyzerConfig &config);
    ~SafetyAnalyzerRegistry(){};

    /// @brief なければ作成する
    std::shared_ptr<SafetyAnalyzer> GetOrCreate(const std::string &streamId);

    /// @retval 登録されていなければ nullptr
    std::shared_ptr<SafetyAnalyzer> Find(const std::string &streamId) const;

    /// @retval 削除したら true
    bool Remove(const std::string &streamId);

    std::vector<std::string> StreamIds() const;
    size_t Size() const;
};
