/// @brief このファイルは、プロジェクト全体で使用されるドメインオブジェクトを定義します。
/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>


/// @brief Bounding box in corner format (正規化座標)
struct BboxXyxy
{
    double x0; // left
    double y0; // top
    double x1; // right
    double y1; // bottom
    double confidence;

    inline double x_center() const { return (x0 + x1) / 2.0; }
    inline double y_center() const { return (y0 + y1) / 2.0; }
    inline double width() const { return x1 - x0; }
    inline double height() const { return y1 - y0; }

    BboxXyxy() : x0(0.0), y0(0.0), x1(0.0), y1(0.0), confidence(0.0){};
    BboxXyxy(const double x0, const double y0, const double x1, const double y1, const double confidence = 0.0)
        : x0(x0), y0(y0), x1(x1), y1(y1), confidence(confidence){};
};

enum class DetectionKind
{
    Person,
    Other
};

/// @brief 外部の推論サービスから受け取る検出結果
struct Detection
{
    DetectionKind kind;
    BboxXyxy bbox;
    std::string label;

    Detection() : kind(DetectionKind::Other){};
    Detection(const DetectionKind kind, const BboxXyxy &bbox, const std::string &label = "")
        : kind(kind), bbox(bbox), label(label){};

    bool IsPerson() const { return kind == DetectionKind::Person; }
};

/// @brief 1フレーム分の観測。生成後は変更しない。
class FrameObservation
{
private:
    std::string frameId;
    int64_t timestampMillis;
    std::vector<Detection> detections;

public:
    FrameObservation() : timestampMillis(0){};
    FrameObservation(const std::string &frameId, const int64_t timestampMillis, const std::vector<Detection> &detections)
        : frameId(frameId), timestampMillis(timestampMillis), detections(detections){};

    const std::string &FrameId() const { return frameId; }
    int64_t TimestampMillis() const { return timestampMillis; }
    const std::vector<Detection> &Detections() const { return detections; }
};

/// @brief トラックの中心座標の履歴の1点
struct TrackPoint
{
    double x;
    double y;
    int64_t timestampMillis;

    TrackPoint() : x(0.0), y(0.0), timestampMillis(0){};
    TrackPoint(const double x, const double y, const int64_t timestampMillis) : x(x), y(y), timestampMillis(timestampMillis){};
};

enum class Severity
{
    Medium,
    High
};

enum class SafetyStatus
{
    Safe,
    Warning,
    Critical
};

enum class OccupancyLevel
{
    Low,
    Medium,
    High
};

enum class AssociationMode
{
    Greedy,   // 検出ごとに最近傍のトラックを割り当てる
    Hungarian // 検出とトラックの距離行列で線形割当を行う
};

/// @brief 密度グリッドの1セル
struct DensityCell
{
    int i; // x方向のインデックス
    int j; // y方向のインデックス
    double x;
    double y;
    double width;
    double height;
    int personCount;
    double density;
    int64_t timestampMillis;

    DensityCell() : i(0), j(0), x(0.0), y(0.0), width(0.0), height(0.0), personCount(0), density(0.0), timestampMillis(0){};
};

/// @brief 1フレーム分のグリッド。(i, j) の row-major 順。
using DensitySnapshot = std::vector<DensityCell>;

struct DensitySurgeEvent
{
    DensityCell zone;
    double currentDensity;
    double previousDensity;
    double increasePercent; // isFromEmpty のときは未定義なので 0
    bool isFromEmpty;       // 直前フレームのセル密度が 0
    Severity severity;
    int64_t timestampMillis;

    DensitySurgeEvent()
        : currentDensity(0.0), previousDensity(0.0), increasePercent(0.0), isFromEmpty(false), severity(Severity::Medium),
          timestampMillis(0){};
};

struct FallingPersonEvent
{
    unsigned int trackId;
    TrackPoint position;
    double velocity;
    Severity severity;
    int64_t timestampMillis;

    FallingPersonEvent() : trackId(0), velocity(0.0), severity(Severity::High), timestampMillis(0){};
};

struct LyingPersonEvent
{
    BboxXyxy bbox;
    double aspectRatio;
    double confidence;
    Severity severity;
    int64_t timestampMillis;

    LyingPersonEvent() : aspectRatio(0.0), confidence(0.0), severity(Severity::Medium), timestampMillis(0){};
};

/// @brief SafetyAnalyzer::ProcessFrame の結果
struct SafetyAnalysisResult
{
    std::vector<DensitySurgeEvent> densitySurges;
    std::vector<FallingPersonEvent> fallingPersons;
    std::vector<LyingPersonEvent> lyingPersons;
    SafetyStatus overallSafetyStatus{SafetyStatus::Safe};
    int personCount{0};
    OccupancyLevel occupancyLevel{OccupancyLevel::Low};

    void Clear()
    {
        densitySurges.clear();
        fallingPersons.clear();
        lyingPersons.clear();
        overallSafetyStatus = SafetyStatus::Safe;
        personCount = 0;
        occupancyLevel = OccupancyLevel::Low;
    }
};

struct SafetyStats
{
    size_t activeTrackCount{0};
    size_t frameHistoryLength{0};
    size_t densityZoneCount{0};
    bool hasLastAnalysis{false}; // 1フレームも処理していないときは false
    int64_t lastAnalysisTimestamp{0};
    uint64_t processedFrameCount{0};
    uint64_t droppedDetectionCount{0};
};

/// @brief 解析パラメータ
struct AnalyzerConfig
{
    size_t maxFrameHistory{30};
    int densityGridSize{8};
    double densityThreshold{0.15};
    double surgeThreshold{0.5};
    double fallingVelocityThreshold{0.3}; // 正規化座標/秒
    size_t fallingWindowSize{3};
    double lyingAspectRatioThreshold{1.5};
    int64_t trackTimeoutMillis{3000};
    int64_t positionRetentionMillis{5000};
    double maxMatchDistance{0.2};
    AssociationMode associationMode{AssociationMode::Greedy};
    int occupancyMediumCount{5};
    int occupancyHighCount{10};
};

const char *ToString(const Severity severity);
const char *ToString(const SafetyStatus status);
const char *ToString(const OccupancyLevel level);
const char *ToString(const AssociationMode mode);
