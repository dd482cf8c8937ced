/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <string>

#include "Types.hpp"
#include "nlohmann/json.hpp"

/// @brief 解析パラメータの読み込み
namespace ConfigUtil
{
    /// @brief JSON オブジェクトから読む。キーがなければ config の値をそのまま使う
    /// @param[in,out] config
    /// @param[out] errorMessage 型が違うか値が不正なときの理由
    bool ParseAnalyzerConfig(const nlohmann::json &j, AnalyzerConfig &config, std::string &errorMessage);

    /// @brief JSON ファイルから読む
    bool LoadAnalyzerConfig(const std::string &path, AnalyzerConfig &config);

    bool ValidateAnalyzerConfig(const AnalyzerConfig &config, std::string &errorMessage);
}
