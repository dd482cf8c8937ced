/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "LinearSumAssignment.hpp"
#include <algorithm>
#include <cfloat> // DBL_MAX

LinearSumAssignment::LinearSumAssignment(const cv::Mat &m) : nrows(m.rows), ncols(m.cols), size(std::max(m.rows, m.cols))
{
    padToSquare(m);
}

/// @brief ダミー要素は元の行列の最大値より大きい値で埋める
void LinearSumAssignment::padToSquare(const cv::Mat &m)
{
    cost = cv::Mat::zeros(size, size, CV_64F);
    if (nrows == 0 || ncols == 0)
    {
        return;
    }

    cv::Mat m64;
    m.convertTo(m64, CV_64F);

    double minVal, maxVal;
    cv::minMaxLoc(m64, &minVal, &maxVal);
    const double padValue = maxVal + 1.0;

    cost.setTo(cv::Scalar(padValue));
    m64.copyTo(cost(cv::Rect(0, 0, ncols, nrows)));
}

/// @brief ポテンシャル (u, v) を使う O(n^3) の Hungarian algorithm
/// @param[out] rowToCol 行ごとに割り当てられた列。正方行列なのですべて埋まる
void LinearSumAssignment::solve(std::vector<int> &rowToCol) const
{
    const int n = size;
    // 1-indexed。p[j] は列 j に割り当てられた行、0 は未割当
    std::vector<double> u(n + 1, 0.0), v(n + 1, 0.0);
    std::vector<int> p(n + 1, 0), way(n + 1, 0);

    for (int i = 1; i <= n; i++)
    {
        p[0] = i;
        int j0 = 0;
        std::vector<double> minv(n + 1, DBL_MAX);
        std::vector<bool> used(n + 1, false);

        // 行 i から増加路を探す
        do
        {
            used[j0] = true;
            const int i0 = p[j0];
            double delta = DBL_MAX;
            int j1 = 0;
            for (int j = 1; j <= n; j++)
            {
                if (used[j])
                {
                    continue;
                }
                const double cur = cost.at<double>(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j])
                {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta)
                {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (int j = 0; j <= n; j++)
            {
                if (used[j])
                {
                    u[p[j]] += delta;
                    v[j] -= delta;
                }
                else
                {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        // 増加路に沿って割当を入れ替える
        do
        {
            const int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    rowToCol.assign(n, -1);
    for (int j = 1; j <= n; j++)
    {
        if (p[j] > 0)
        {
            rowToCol[p[j] - 1] = j - 1;
        }
    }
}

void LinearSumAssignment::ComputeAssociation(std::list<RowCol> &association)
{
    if (nrows == 0 || ncols == 0)
    {
        return;
    }

    std::vector<int> rowToCol;
    solve(rowToCol);

    for (int r = 0; r < nrows; r++)
    {
        const int c = rowToCol[r];
        if (c < 0 || c >= ncols)
        {
            continue; // ダミー列への割当
        }
        RowCol rc;
        rc.row = r;
        rc.col = c;
        association.push_back(rc);
    }
}
