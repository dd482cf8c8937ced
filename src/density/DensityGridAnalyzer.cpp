/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "DensityGridAnalyzer.hpp"
#include "tracking/BboxUtil.hpp"

void DensityGridAnalyzer::Analyze(const FrameObservation &frame, DensitySnapshot &cells) const
{
    cells.clear();
    if (gridSize <= 0)
    {
        return;
    }

    const double cellWidth = 1.0 / gridSize;
    const double cellHeight = 1.0 / gridSize;

    std::vector<cv::Point2d> centers;
    for (const Detection &detection : frame.Detections())
    {
        if (detection.IsPerson()) centers.push_back(BboxUtil::Center(detection.bbox));
    }

    cells.reserve((size_t)gridSize * gridSize);
    for (int i = 0; i < gridSize; i++)
    {
        for (int j = 0; j < gridSize; j++)
        {
            // cv::Rect2d::contains は左上を含み右下を含まない
            const cv::Rect2d zone(i * cellWidth, j * cellHeight, cellWidth, cellHeight);

            int personCount = 0;
            for (const cv::Point2d &center : centers)
            {
                if (zone.contains(center)) personCount++;
            }

            DensityCell cell;
            cell.i = i;
            cell.j = j;
            cell.x = zone.x;
            cell.y = zone.y;
            cell.width = zone.width;
            cell.height = zone.height;
            cell.personCount = personCount;
            cell.density = personCount / zone.area();
            cell.timestampMillis = frame.TimestampMillis();
            cells.push_back(cell);
        }
    }
}
