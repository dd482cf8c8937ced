/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <gflags/gflags.h>

#include "nlohmann/json.hpp"

#include "io/SafetyJson.hpp"
#include "pipeline/IncidentExtractor.hpp"
#include "pipeline/SafetyAnalyzer.hpp"
#include "utils/ConfigUtil.hpp"
#include "utils/Timer.hpp"
#include "Types.hpp"

// Define and parser command line arguments
DEFINE_string(input_file, "inputs/frames.jsonl", "Path to input JSON Lines file. One frame observation per line");
DEFINE_string(output_dir, "outputs", "Path to output dir");
DEFINE_string(config, "", "Path to analyzer config JSON file. Defaults are used when empty");
DEFINE_bool(incidents, false, "Save incidents as JSON Lines");
DEFINE_bool(verbose, false, "Print safety status changes");


std::string getStem(const std::string &filePath)
{
    const size_t periodIdx = filePath.find_last_of(".");
    size_t slashIdx = filePath.find_last_of("/");
    slashIdx = (slashIdx == std::string::npos) ? 0 : slashIdx + 1;
    if (periodIdx == std::string::npos || periodIdx < slashIdx)
    {
        return filePath.substr(slashIdx);
    }
    return filePath.substr(slashIdx, periodIdx - slashIdx);
}


void writeIncidents(std::ofstream &incidentOfs, const FrameObservation &frame, const SafetyAnalysisResult &result)
{
    std::vector<SafetyIncident> incidents;
    IncidentExtractor::Extract(frame.FrameId(), frame.TimestampMillis(), result, incidents);
    for (const SafetyIncident &incident : incidents)
    {
        incidentOfs << SafetyJson::IncidentToJson(incident, result).dump() << std::endl;
    }
}


bool runSafetyAnalysis(SafetyAnalyzer &analyzer, const std::string &filePath, const std::string &outDir,
                       const bool isSaveIncidents, const bool isVerbose)
{
    const std::string basename = getStem(filePath);

    std::ifstream inputIfs(filePath);
    if (!inputIfs)
    {
        std::cout << "Couldn't read input: " << filePath << std::endl;
        return false;
    }
    else
    {
        std::cout << "Read input: " << filePath << std::endl;
    }

    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec)
    {
        std::cout << "Couldn't create output dir: " << outDir << " (" << ec.message() << ")" << std::endl;
        return false;
    }

    const std::string resultFile = outDir + "/" + basename + "_safety.jsonl";
    std::ofstream resultOfs(resultFile, std::ios_base::out);
    if (!resultOfs)
    {
        std::cout << "Couldn't open output: " << resultFile << std::endl;
        return false;
    }

    std::ofstream incidentOfs;
    if (isSaveIncidents)
    {
        const std::string incidentFile = outDir + "/" + basename + "_incidents.jsonl";
        incidentOfs.open(incidentFile, std::ios_base::out);
        if (!incidentOfs)
        {
            std::cout << "Couldn't open output: " << incidentFile << std::endl;
            return false;
        }
    }

    std::cout << "Running analysis..." << std::endl;

    Timer t_analysis("Safety Analysis");
    std::map<SafetyStatus, int> statusCount;
    SafetyStatus prevStatus = SafetyStatus::Safe;
    int lineCnt = 0;
    int frameCnt = 0;
    std::string line;
    while (std::getline(inputIfs, line))
    {
        lineCnt++;
        if (line.empty())
        {
            continue; // 空行は読み飛ばす
        }

        FrameObservation frame;
        std::string errorMessage;
        if (!SafetyJson::ParseFrame(line, frame, errorMessage))
        {
            std::cout << "Couldn't parse line " << lineCnt << ": " << errorMessage << std::endl;
            return false;
        }

        SafetyAnalysisResult result;
        t_analysis.Start();
        analyzer.ProcessFrame(frame, result);
        t_analysis.End();

        resultOfs << SafetyJson::ResultToJson(frame.FrameId(), frame.TimestampMillis(), result).dump() << std::endl;
        if (isSaveIncidents) writeIncidents(incidentOfs, frame, result);

        if (isVerbose && result.overallSafetyStatus != prevStatus)
        {
            std::cout << "Frame: " << frame.FrameId() << "," << frame.TimestampMillis() << " " << ToString(prevStatus)
                      << " -> " << ToString(result.overallSafetyStatus) << std::endl;
        }
        prevStatus = result.overallSafetyStatus;
        statusCount[result.overallSafetyStatus]++;
        frameCnt++;
    }

    std::cout << "Processed " << frameCnt << " frames" << std::endl;
    for (const SafetyStatus status : {SafetyStatus::Safe, SafetyStatus::Warning, SafetyStatus::Critical})
    {
        std::cout << "  " << ToString(status) << ": " << statusCount[status] << std::endl;
    }
    std::cout << "Stats: " << SafetyJson::StatsToJson(analyzer.GetStats()).dump() << std::endl;
    std::cout << t_analysis.ResultString() << std::endl;

    resultOfs.close();
    if (isSaveIncidents) incidentOfs.close();
    return true;
}


int main(int argc, char **argv)
{
    gflags::SetUsageMessage("Offline analysis program for crowd safety.");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    AnalyzerConfig config;
    if (!FLAGS_config.empty() && !ConfigUtil::LoadAnalyzerConfig(FLAGS_config, config))
    {
        std::cout << "Failed to load analyzer config" << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "Association mode: " << ToString(config.associationMode) << std::endl;

    SafetyAnalyzer analyzer(config);

    // Run analysis
    if (runSafetyAnalysis(analyzer, FLAGS_input_file, FLAGS_output_dir, FLAGS_incidents, FLAGS_verbose))
    {
        return EXIT_SUCCESS;
    }
    else
    {
        return EXIT_FAILURE;
    }
}
