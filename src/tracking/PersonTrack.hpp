/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <deque>

#include "Types.hpp"

/// @brief 1人の人物のトラックレット。中心座標の履歴と転倒フラグを保持する
class PersonTrack
{
private:
    unsigned int id;
    std::deque<TrackPoint> positions; // 古い順
    int64_t lastSeenMillis;
    bool isFalling; // 一度立ったら下ろさない

    void prune(const int64_t nowMillis, const int64_t retentionMillis);

public:
    PersonTrack(const unsigned int id, const TrackPoint &initialPosition);
    ~PersonTrack(){};

    // Getter
    unsigned int GetId() const { return id; }
    int64_t LastSeenMillis() const { return lastSeenMillis; }
    const std::deque<TrackPoint> &Positions() const { return positions; }
    const TrackPoint &LastPosition() const { return positions.back(); }
    bool IsFalling() const { return isFalling; }
    bool IsStale(const int64_t nowMillis, const int64_t timeoutMillis) const;

    bool Update(const TrackPoint &position, const int64_t retentionMillis);
    void MarkFalling() { isFalling = true; }
};
