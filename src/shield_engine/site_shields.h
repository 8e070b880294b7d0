/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_SITE_SHIELDS_H_
#define KSHIELDENGINE_SHIELD_ENGINE_SITE_SHIELDS_H_

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "kbase/basic_macros.h"
#include "kbase/pickle.h"

#include "shield_engine/global_stats.h"
#include "shield_engine/time_util.h"

namespace sse {

struct SiteShields {
    std::string domain;
    bool ad_blocking;
    bool tracker_blocking;
    bool third_party_cookies;   // Blocks every request leaving the domain when on.
    bool fingerprinting_protection;
    bool https_only;
    uint32_t scripts_blocked;
    uint32_t trackers_blocked;
    uint32_t ads_blocked;
    Timestamp last_updated;

    SiteShields();

    explicit SiteShields(std::string domain);
};

// Shields configured for individual sites.
// Sites never configured explicitly get the default shields, which are synthesized on read
// and never stored.
class SiteShieldRegistry {
public:
    SiteShieldRegistry() = default;

    ~SiteShieldRegistry() = default;

    DISALLOW_COPY(SiteShieldRegistry);

    // Returns nullptr if no shields were set for the `domain`.
    const SiteShields* Find(const std::string& domain) const;

    SiteShields Get(const std::string& domain) const;

    // Stores `shields` for the `domain`, replacing the previous ones as a whole.
    void Update(const std::string& domain, SiteShields shields);

    // Forgets the shields of `domain` and returns the defaults it now has.
    SiteShields Reset(const std::string& domain);

    // Counts a blocked request on the `domain`, together with the global counter in `stats`.
    // Both are left untouched if the `domain` has no stored shields; returns false then.
    bool Increment(const std::string& domain, BlockCategory category, uint64_t bytes_saved,
                   uint64_t time_saved_ms, StatsAggregator& stats);

    // Returns all stored shields ordered by domain.
    std::vector<SiteShields> Enumerate() const;

    void Restore(std::vector<SiteShields> entries);

    size_t size() const
    {
        return shields_.size();
    }

private:
    std::unordered_map<std::string, SiteShields> shields_;
};

kbase::Pickle& operator<<(kbase::Pickle& pickle, const SiteShields& shields);

SiteShields ReadSiteShields(kbase::PickleReader& reader);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_SITE_SHIELDS_H_
