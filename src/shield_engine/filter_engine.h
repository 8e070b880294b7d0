/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_FILTER_ENGINE_H_
#define KSHIELDENGINE_SHIELD_ENGINE_FILTER_ENGINE_H_

#include <cstdint>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kbase/basic_macros.h"
#include "kbase/pickle.h"

#include "shield_engine/engine_config.h"
#include "shield_engine/global_stats.h"
#include "shield_engine/list_fetcher.h"
#include "shield_engine/list_updater.h"
#include "shield_engine/rule_store.h"
#include "shield_engine/site_shields.h"

namespace sse {

enum class DecisionReason {
    MALFORMED_URL,
    SHIELDS_DOWN,
    THIRD_PARTY_REQUEST,
    BLOCKING_RULE,
    EXCEPTION_RULE,
    NO_MATCHING_RULE
};

const char* DecisionReasonName(DecisionReason reason);

struct RequestDecision {
    bool blocked;
    DecisionReason reason;
    std::string list_id;    // Empty unless a rule decided.
    std::string rule_text;
};

// The only entry point of the engine. An instance is shared by everything serving requests
// and is safe to use from multiple threads: queries run concurrently with each other, while
// mutations are serialized.
class FilterEngine {
public:
    // Filter lists are fetched via a CurlListFetcher.
    explicit FilterEngine(const EngineConfig& config);

    FilterEngine(const EngineConfig& config, std::unique_ptr<ListFetcher> fetcher);

    ~FilterEngine() = default;

    DISALLOW_COPY(FilterEngine);

    DISALLOW_MOVE(FilterEngine);

    // Returns true if the request should be blocked.
    // A malformed `request_url` is never blocked, and shields of the `origin_domain` take
    // precedence over any filter rule.
    bool ShouldBlockRequest(const std::string& request_url, const std::string& resource_type,
                            const std::string& origin_domain) const;

    // Same as ShouldBlockRequest(), but also tells what made the decision.
    RequestDecision CheckRequest(const std::string& request_url, const std::string& resource_type,
                                 const std::string& origin_domain) const;

    SiteShields GetSiteShields(const std::string& domain) const;

    void UpdateSiteShields(const std::string& domain, SiteShields shields);

    SiteShields ResetSiteShields(const std::string& domain);

    std::vector<SiteShields> GetAllSiteShields() const;

    // `category` is one of `ad`, `tracker` and `script`; anything else is ignored.
    // Nothing is counted unless shields were set for the `domain`.
    void IncrementBlockedCount(const std::string& domain, const std::string& category,
                               uint64_t bytes_saved = 0, uint64_t time_saved_ms = 0);

    GlobalStats GetGlobalStats() const;

    void ResetGlobalStats();

    std::vector<FilterListStatus> GetFilterLists() const;

    // Throws NotFoundError if there is no such list.
    void SetFilterListEnabled(const std::string& list_id, bool enabled);

    // The new list is enabled and empty until being refreshed.
    FilterListStatus AddFilterList(const std::string& name, const std::string& source_url);

    // Throws NotFoundError if there is no such list, and InvalidArgumentError for the user
    // rules list.
    void RemoveFilterList(const std::string& list_id);

    // Throws InvalidArgumentError if `rule_text` carries no rule.
    void AddCustomRule(const std::string& rule_text);

    // For rules with domain scopes or resource flags, which the list syntax doesn't express.
    void AddCustomRule(Rule rule);

    // Throws NotFoundError if there is no such custom rule.
    void RemoveCustomRule(const std::string& rule_text);

    void RemoveCustomRule(const Rule& rule);

    std::vector<std::string> GetCustomRules() const;

    // Refreshes every enabled list that has a source url. A list failed to refresh keeps
    // its previous rules, and doesn't prevent other lists from being refreshed.
    RefreshReport RefreshFilterLists();

    // Throws NotFoundError if there is no such list, and InvalidArgumentError if the list has
    // no source url. Other failures are reported via the outcome.
    ListRefreshOutcome RefreshFilterList(const std::string& list_id);

    // Runs RefreshFilterLists() on another thread.
    // The engine must outlive the returned future.
    std::future<RefreshReport> RefreshFilterListsAsync();

    // Lists with their rules, site shields and global stats.
    kbase::Pickle ExportState() const;

    // Replaces the whole state with an exported one.
    // Throws SnapshotError if the data was not produced by ExportState(); the current state
    // is kept then.
    void ImportState(const void* data, size_t size_in_bytes);

private:
    ListRefreshOutcome RefreshSource(const FilterListSource& source);

    std::string NextCustomListId();

private:
    mutable std::shared_timed_mutex mutex_;
    RuleStore rule_store_;
    SiteShieldRegistry shield_registry_;
    StatsAggregator stats_;
    ListUpdater updater_;
    unsigned int custom_list_count_;
};

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_FILTER_ENGINE_H_
