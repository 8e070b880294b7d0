/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_GLOBAL_STATS_H_
#define KSHIELDENGINE_SHIELD_ENGINE_GLOBAL_STATS_H_

#include <cstdint>
#include <string>

#include "kbase/basic_macros.h"
#include "kbase/pickle.h"

#include "shield_engine/time_util.h"

namespace sse {

enum class BlockCategory {
    AD,
    TRACKER,
    SCRIPT
};

// Accepts `ad`, `tracker` and `script`.
// Returns false for anything else, and `category` is left untouched.
bool BlockCategoryFromString(const std::string& name, BlockCategory& category);

const char* BlockCategoryName(BlockCategory category);

struct GlobalStats {
    uint64_t total_ads_blocked;
    uint64_t total_trackers_blocked;
    uint64_t total_scripts_blocked;
    uint64_t bandwidth_saved;   // In bytes.
    uint64_t time_saved_ms;
    Timestamp last_reset;

    GlobalStats();
};

// Process-wide counters. They only grow until being reset by the caller.
class StatsAggregator {
public:
    StatsAggregator() = default;

    ~StatsAggregator() = default;

    DISALLOW_COPY(StatsAggregator);

    void RecordBlocked(BlockCategory category, uint64_t bytes_saved, uint64_t time_saved_ms);

    // Zeroes all counters and stamps `last_reset` with the current time.
    void Reset();

    void Restore(const GlobalStats& stats);

    const GlobalStats& stats() const
    {
        return stats_;
    }

private:
    GlobalStats stats_;
};

kbase::Pickle& operator<<(kbase::Pickle& pickle, const GlobalStats& stats);

GlobalStats ReadGlobalStats(kbase::PickleReader& reader);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_GLOBAL_STATS_H_
