/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_TIME_UTIL_H_
#define KSHIELDENGINE_SHIELD_ENGINE_TIME_UTIL_H_

#include <chrono>
#include <cstdint>
#include <string>

namespace sse {

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp Now()
{
    return std::chrono::system_clock::now();
}

// Snapshots store timestamps as milliseconds since the unix epoch.
int64_t TimestampToMillis(Timestamp timestamp);

// Throws SnapshotError if `millis` is beyond what the system clock can represent.
Timestamp TimestampFromMillis(int64_t millis);

// Returns UTC time in the form of `2016-08-01T12:30:00Z`.
std::string FormatTimestamp(Timestamp timestamp);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_TIME_UTIL_H_
