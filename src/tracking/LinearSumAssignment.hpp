/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <list>
#include <opencv2/core.hpp>
#include <vector>

/// @brief 線形割当 (Hungarian Algorithm) の結果を行番号列番号で格納する構造体
struct RowCol
{
    int row;
    int col;
};

/// @brief Hungarian algorithm を用いて linear sum assignment (コスト最小) を行う
/// 非正方行列はダミーの行または列で正方行列に拡張して解く。
class LinearSumAssignment
{
private:
    cv::Mat cost; // CV_64F, 正方行列に拡張済み
    int nrows, ncols, size;

    void padToSquare(const cv::Mat &m);
    void solve(std::vector<int> &rowToCol) const;

public:
    explicit LinearSumAssignment(const cv::Mat &m);
    ~LinearSumAssignment(){};

    /// @param[out] association 割り当てられた (行, 列) の組。行番号の昇順。ダミーへの割当は含まない
    void ComputeAssociation(std::list<RowCol> &association);
};
