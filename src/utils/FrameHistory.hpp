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
#include <stdexcept>

/// @brief 直近 maxSize 件を保持する時系列バッファ。上限を超えたら古いものから捨てる (FIFO)。
template <typename T> class FrameHistory
{
private:
    std::deque<T> items;
    size_t maxSize;

public:
    explicit FrameHistory(const size_t maxSize = 30) : maxSize(maxSize) {}

    void Push(const T &item)
    {
        items.push_back(item);
        while (items.size() > maxSize)
        {
            items.pop_front();
        }
    }

    /// @brief 上限を変更する。超過分はその場で捨てる
    void SetMaxSize(const size_t maxSize)
    {
        this->maxSize = maxSize;
        while (items.size() > maxSize)
        {
            items.pop_front();
        }
    }

    size_t MaxSize() const { return maxSize; }
    size_t Size() const { return items.size(); }
    bool Empty() const { return items.empty(); }

    /// @brief 最新の要素。空のときは std::out_of_range
    const T &Latest() const
    {
        if (items.empty()) throw std::out_of_range("FrameHistory is empty");
        return items.back();
    }

    const std::deque<T> &Items() const { return items; }

    void Clear() { items.clear(); }
};
