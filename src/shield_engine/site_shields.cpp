/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/site_shields.h"

#include <algorithm>

#include "kbase/error_exception_util.h"

#include "shield_engine/engine_errors.h"

namespace sse {

SiteShields::SiteShields()
    : ad_blocking(true),
      tracker_blocking(true),
      third_party_cookies(false),
      fingerprinting_protection(true),
      https_only(true),
      scripts_blocked(0),
      trackers_blocked(0),
      ads_blocked(0),
      last_updated(Now())
{}

SiteShields::SiteShields(std::string domain)
    : SiteShields()
{
    this->domain = std::move(domain);
}

const SiteShields* SiteShieldRegistry::Find(const std::string& domain) const
{
    auto it = shields_.find(domain);
    return it == shields_.end() ? nullptr : &it->second;
}

SiteShields SiteShieldRegistry::Get(const std::string& domain) const
{
    const SiteShields* shields = Find(domain);
    return shields ? *shields : SiteShields(domain);
}

void SiteShieldRegistry::Update(const std::string& domain, SiteShields shields)
{
    shields.domain = domain;
    shields_[domain] = std::move(shields);
}

SiteShields SiteShieldRegistry::Reset(const std::string& domain)
{
    shields_.erase(domain);
    return SiteShields(domain);
}

bool SiteShieldRegistry::Increment(const std::string& domain, BlockCategory category,
                                   uint64_t bytes_saved, uint64_t time_saved_ms,
                                   StatsAggregator& stats)
{
    auto it = shields_.find(domain);
    if (it == shields_.end()) {
        return false;
    }

    SiteShields& shields = it->second;
    switch (category) {
        case BlockCategory::AD:
            ++shields.ads_blocked;
            break;

        case BlockCategory::TRACKER:
            ++shields.trackers_blocked;
            break;

        case BlockCategory::SCRIPT:
            ++shields.scripts_blocked;
            break;

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<int>(category)).Require();
    }

    shields.last_updated = Now();
    stats.RecordBlocked(category, bytes_saved, time_saved_ms);

    return true;
}

std::vector<SiteShields> SiteShieldRegistry::Enumerate() const
{
    std::vector<SiteShields> entries;
    entries.reserve(shields_.size());
    for (const auto& entry : shields_) {
        entries.push_back(entry.second);
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.domain < rhs.domain;
    });

    return entries;
}

void SiteShieldRegistry::Restore(std::vector<SiteShields> entries)
{
    shields_.clear();
    for (auto& shields : entries) {
        std::string domain = shields.domain;
        shields_[domain] = std::move(shields);
    }
}

kbase::Pickle& operator<<(kbase::Pickle& pickle, const SiteShields& shields)
{
    pickle << shields.domain
           << shields.ad_blocking
           << shields.tracker_blocking
           << shields.third_party_cookies
           << shields.fingerprinting_protection
           << shields.https_only
           << shields.scripts_blocked
           << shields.trackers_blocked
           << shields.ads_blocked
           << TimestampToMillis(shields.last_updated);
    return pickle;
}

SiteShields ReadSiteShields(kbase::PickleReader& reader)
{
    SiteShields shields;
    int64_t last_updated = 0;
    reader >> shields.domain
           >> shields.ad_blocking
           >> shields.tracker_blocking
           >> shields.third_party_cookies
           >> shields.fingerprinting_protection
           >> shields.https_only
           >> shields.scripts_blocked
           >> shields.trackers_blocked
           >> shields.ads_blocked
           >> last_updated;
    ENSURE(RAISE, !shields.domain.empty()).Require<SnapshotError>();
    shields.last_updated = TimestampFromMillis(last_updated);
    return shields;
}

}   // namespace sse
