/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/global_stats.h"

#include <map>

#include "kbase/error_exception_util.h"

namespace {

using sse::BlockCategory;

const std::map<std::string, BlockCategory> kBlockCategoryMap {
    { "ad", BlockCategory::AD },
    { "tracker", BlockCategory::TRACKER },
    { "script", BlockCategory::SCRIPT }
};

}   // namespace

namespace sse {

bool BlockCategoryFromString(const std::string& name, BlockCategory& category)
{
    auto it = kBlockCategoryMap.find(name);
    if (it == kBlockCategoryMap.end()) {
        return false;
    }

    category = it->second;
    return true;
}

const char* BlockCategoryName(BlockCategory category)
{
    switch (category) {
        case BlockCategory::AD:
            return "ad";

        case BlockCategory::TRACKER:
            return "tracker";

        case BlockCategory::SCRIPT:
            return "script";

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<int>(category)).Require();
            return "";
    }
}

GlobalStats::GlobalStats()
    : total_ads_blocked(0),
      total_trackers_blocked(0),
      total_scripts_blocked(0),
      bandwidth_saved(0),
      time_saved_ms(0),
      last_reset(Now())
{}

void StatsAggregator::RecordBlocked(BlockCategory category, uint64_t bytes_saved,
                                    uint64_t time_saved_ms)
{
    switch (category) {
        case BlockCategory::AD:
            ++stats_.total_ads_blocked;
            break;

        case BlockCategory::TRACKER:
            ++stats_.total_trackers_blocked;
            break;

        case BlockCategory::SCRIPT:
            ++stats_.total_scripts_blocked;
            break;

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<int>(category)).Require();
    }

    stats_.bandwidth_saved += bytes_saved;
    stats_.time_saved_ms += time_saved_ms;
}

void StatsAggregator::Reset()
{
    stats_ = GlobalStats();
}

void StatsAggregator::Restore(const GlobalStats& stats)
{
    stats_ = stats;
}

kbase::Pickle& operator<<(kbase::Pickle& pickle, const GlobalStats& stats)
{
    pickle << stats.total_ads_blocked
           << stats.total_trackers_blocked
           << stats.total_scripts_blocked
           << stats.bandwidth_saved
           << stats.time_saved_ms
           << TimestampToMillis(stats.last_reset);
    return pickle;
}

GlobalStats ReadGlobalStats(kbase::PickleReader& reader)
{
    GlobalStats stats;
    int64_t last_reset = 0;
    reader >> stats.total_ads_blocked
           >> stats.total_trackers_blocked
           >> stats.total_scripts_blocked
           >> stats.bandwidth_saved
           >> stats.time_saved_ms
           >> last_reset;
    stats.last_reset = TimestampFromMillis(last_reset);
    return stats;
}

}   // namespace sse
