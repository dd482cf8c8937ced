/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#include "PersonTrack.hpp"

/// @brief コンストラクタ
/// @param id トラッキングデータに割り当てるID
/// @param initialPosition 最初に観測された中心座標
PersonTrack::PersonTrack(const unsigned int id, const TrackPoint &initialPosition)
    : id(id), lastSeenMillis(initialPosition.timestampMillis), isFalling(false)
{
    positions.push_back(initialPosition);
}

/// @brief 最後に観測されてから timeoutMillis を超えていれば true
bool PersonTrack::IsStale(const int64_t nowMillis, const int64_t timeoutMillis) const
{
    return nowMillis - lastSeenMillis > timeoutMillis;
}

/// @brief 観測した中心座標を追加し、保持期間を過ぎた座標を削除する
/// 最新の座標より古い時刻の観測は追加しない。同じ時刻の観測は最新の座標を置き換える。
/// @retval 座標を反映したら true
bool PersonTrack::Update(const TrackPoint &position, const int64_t retentionMillis)
{
    if (!positions.empty())
    {
        const int64_t latest = positions.back().timestampMillis;
        if (position.timestampMillis < latest)
        {
            return false;
        }
        if (position.timestampMillis == latest)
        {
            positions.pop_back();
        }
    }

    positions.push_back(position);
    lastSeenMillis = position.timestampMillis;
    prune(position.timestampMillis, retentionMillis);
    return true;
}

void PersonTrack::prune(const int64_t nowMillis, const int64_t retentionMillis)
{
    // 最新の座標は now と同時刻なので必ず残る
    while (!positions.empty() && nowMillis - positions.front().timestampMillis >= retentionMillis)
    {
        positions.pop_front();
    }
}
