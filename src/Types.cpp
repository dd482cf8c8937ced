/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include "Types.hpp"

const char *ToString(const Severity severity)
{
    switch (severity)
    {
    case Severity::High:
        return "HIGH";
    case Severity::Medium:
        return "MEDIUM";
    }
    return "MEDIUM";
}

const char *ToString(const SafetyStatus status)
{
    switch (status)
    {
    case SafetyStatus::Critical:
        return "CRITICAL";
    case SafetyStatus::Warning:
        return "WARNING";
    case SafetyStatus::Safe:
        return "SAFE";
    }
    return "SAFE";
}

const char *ToString(const OccupancyLevel level)
{
    switch (level)
    {
    case OccupancyLevel::High:
        return "HIGH";
    case OccupancyLevel::Medium:
        return "MEDIUM";
    case OccupancyLevel::Low:
        return "LOW";
    }
    return "LOW";
}

const char *ToString(const AssociationMode mode)
{
    switch (mode)
    {
    case AssociationMode::Hungarian:
        return "hungarian";
    case AssociationMode::Greedy:
        return "greedy";
    }
    return "greedy";
}
