/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/filter_engine.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <set>

#include "kbase/error_exception_util.h"
#include "kbase/logging.h"

#include "shield_engine/url_util.h"

namespace {

using sse::FilterList;
using sse::FilterListSource;
using sse::InvalidArgumentError;
using sse::Rule;
using sse::RuleSequence;

using ReadLock = std::shared_lock<std::shared_timed_mutex>;
using WriteLock = std::unique_lock<std::shared_timed_mutex>;

constexpr const char kUserRulesListName[] = "User rules";
constexpr const char kCustomListIdPrefix[] = "custom-";

constexpr const char kSnapshotMagic[] = "KSHIELD-STATE";
constexpr const uint32_t kSnapshotVersion = 2;

Rule ParseCustomRule(const std::string& rule_text)
{
    RuleSequence rules;
    bool parsed = sse::ParseRuleLine(rule_text, rules);
    if (!parsed) {
        LOG(WARNING) << "Custom rule rejected: " << rule_text;
    }

    ENSURE(RAISE, parsed)(rule_text).Require<InvalidArgumentError>();
    return std::move(rules.front());
}

bool HasSourceURL(const FilterList& list)
{
    return !list.source_url().empty();
}

FilterListSource ToSource(const FilterList& list)
{
    return FilterListSource { list.id(), list.source_url() };
}

}   // namespace

namespace sse {

FilterEngine::FilterEngine(const EngineConfig& config)
    : FilterEngine(config, std::make_unique<CurlListFetcher>(config.fetch_timeout_seconds,
                                                             config.user_agent))
{}

FilterEngine::FilterEngine(const EngineConfig& config, std::unique_ptr<ListFetcher> fetcher)
    : rule_store_(config.compile_patterns),
      updater_(std::move(fetcher), config.compile_patterns),
      custom_list_count_(0)
{
    rule_store_.AddFilterList(FilterList(kUserRulesListId, kUserRulesListName, std::string(),
                                         true));
    for (const auto& list : config.filter_lists) {
        rule_store_.AddFilterList(FilterList(list.id, list.name, list.url, list.enabled));
    }
}

const char* DecisionReasonName(DecisionReason reason)
{
    switch (reason) {
        case DecisionReason::MALFORMED_URL:
            return "malformed-url";

        case DecisionReason::SHIELDS_DOWN:
            return "shields-down";

        case DecisionReason::THIRD_PARTY_REQUEST:
            return "third-party-request";

        case DecisionReason::BLOCKING_RULE:
            return "blocking-rule";

        case DecisionReason::EXCEPTION_RULE:
            return "exception-rule";

        case DecisionReason::NO_MATCHING_RULE:
            return "no-matching-rule";

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<int>(reason)).Require();
            return "";
    }
}

bool FilterEngine::ShouldBlockRequest(const std::string& request_url,
                                      const std::string& resource_type,
                                      const std::string& origin_domain) const
{
    return CheckRequest(request_url, resource_type, origin_domain).blocked;
}

RequestDecision FilterEngine::CheckRequest(const std::string& request_url,
                                           const std::string& resource_type,
                                           const std::string& origin_domain) const
{
    RequestDecision decision {false, DecisionReason::NO_MATCHING_RULE, std::string(),
                              std::string()};

    std::string request_domain;
    if (!ParseURLHost(request_url, request_domain)) {
        decision.reason = DecisionReason::MALFORMED_URL;
        return decision;
    }

    ReadLock lock(mutex_);

    const SiteShields* shields = shield_registry_.Find(origin_domain);
    if (shields) {
        if (!shields->ad_blocking && !shields->tracker_blocking) {
            decision.reason = DecisionReason::SHIELDS_DOWN;
            return decision;
        }

        if (shields->third_party_cookies && request_domain != origin_domain) {
            decision.blocked = true;
            decision.reason = DecisionReason::THIRD_PARTY_REQUEST;
            return decision;
        }
    }

    auto match = rule_store_.FindMatch(request_url, resource_type, origin_domain);
    if (match.result == MatchResult::NOT_MATCHED) {
        return decision;
    }

    decision.blocked = match.result == MatchResult::BLOCKING_MATCHED;
    decision.reason = decision.blocked ? DecisionReason::BLOCKING_RULE :
                                         DecisionReason::EXCEPTION_RULE;
    decision.list_id = match.list->id();
    decision.rule_text = RuleToText(*match.rule);

    return decision;
}

SiteShields FilterEngine::GetSiteShields(const std::string& domain) const
{
    ReadLock lock(mutex_);
    return shield_registry_.Get(domain);
}

void FilterEngine::UpdateSiteShields(const std::string& domain, SiteShields shields)
{
    WriteLock lock(mutex_);
    shield_registry_.Update(domain, std::move(shields));
}

SiteShields FilterEngine::ResetSiteShields(const std::string& domain)
{
    WriteLock lock(mutex_);
    return shield_registry_.Reset(domain);
}

std::vector<SiteShields> FilterEngine::GetAllSiteShields() const
{
    ReadLock lock(mutex_);
    return shield_registry_.Enumerate();
}

void FilterEngine::IncrementBlockedCount(const std::string& domain, const std::string& category,
                                         uint64_t bytes_saved, uint64_t time_saved_ms)
{
    BlockCategory block_category;
    if (!BlockCategoryFromString(category, block_category)) {
        LOG(WARNING) << "Unknown block category " << category << " for " << domain;
        return;
    }

    // Per-site and global counters must change together.
    WriteLock lock(mutex_);
    shield_registry_.Increment(domain, block_category, bytes_saved, time_saved_ms, stats_);
}

GlobalStats FilterEngine::GetGlobalStats() const
{
    ReadLock lock(mutex_);
    return stats_.stats();
}

void FilterEngine::ResetGlobalStats()
{
    WriteLock lock(mutex_);
    stats_.Reset();
}

std::vector<FilterListStatus> FilterEngine::GetFilterLists() const
{
    ReadLock lock(mutex_);
    return rule_store_.GetFilterListStatuses();
}

void FilterEngine::SetFilterListEnabled(const std::string& list_id, bool enabled)
{
    WriteLock lock(mutex_);
    rule_store_.SetFilterListEnabled(list_id, enabled);
}

std::string FilterEngine::NextCustomListId()
{
    std::string list_id;
    do {
        list_id = kCustomListIdPrefix + std::to_string(++custom_list_count_);
    } while (rule_store_.HasFilterList(list_id));

    return list_id;
}

FilterListStatus FilterEngine::AddFilterList(const std::string& name,
                                             const std::string& source_url)
{
    ENSURE(RAISE, !source_url.empty())(name).Require<InvalidArgumentError>();

    WriteLock lock(mutex_);
    auto list_id = NextCustomListId();
    rule_store_.AddFilterList(FilterList(list_id, name.empty() ? list_id : name, source_url,
                                         true));

    LOG(INFO) << "Filter list " << list_id << " added for " << source_url;

    const auto& list = rule_store_.GetFilterList(list_id);
    return FilterListStatus {
        list.id(), list.name(), list.source_url(), list.enabled(), list.last_updated(),
        list.rules().size(), list.info()
    };
}

void FilterEngine::RemoveFilterList(const std::string& list_id)
{
    ENSURE(RAISE, list_id != kUserRulesListId).Require<InvalidArgumentError>();

    WriteLock lock(mutex_);
    rule_store_.RemoveFilterList(list_id);

    LOG(INFO) << "Filter list " << list_id << " removed";
}

void FilterEngine::AddCustomRule(const std::string& rule_text)
{
    AddCustomRule(ParseCustomRule(rule_text));
}

void FilterEngine::AddCustomRule(Rule rule)
{
    WriteLock lock(mutex_);
    const auto& rules = rule_store_.GetFilterList(kUserRulesListId).rules();
    if (std::find(rules.cbegin(), rules.cend(), rule) != rules.cend()) {
        return;
    }

    rule_store_.AppendRule(kUserRulesListId, std::move(rule));
}

void FilterEngine::RemoveCustomRule(const std::string& rule_text)
{
    RuleSequence rules;
    bool parsed = ParseRuleLine(rule_text, rules);
    ENSURE(RAISE, parsed)(rule_text).Require<NotFoundError>();
    RemoveCustomRule(rules.front());
}

void FilterEngine::RemoveCustomRule(const Rule& rule)
{
    WriteLock lock(mutex_);
    bool removed = rule_store_.RemoveRule(kUserRulesListId, rule);
    ENSURE(RAISE, removed)(rule.pattern).Require<NotFoundError>();
}

std::vector<std::string> FilterEngine::GetCustomRules() const
{
    ReadLock lock(mutex_);
    const auto& rules = rule_store_.GetFilterList(kUserRulesListId).rules();

    std::vector<std::string> rule_texts;
    rule_texts.reserve(rules.size());
    std::transform(rules.cbegin(), rules.cend(), std::back_inserter(rule_texts), RuleToText);

    return rule_texts;
}

ListRefreshOutcome FilterEngine::RefreshSource(const FilterListSource& source)
{
    ListRefreshOutcome outcome {source.list_id, false, 0, ErrorKind::NONE, std::string()};
    try {
        // Fetching and parsing may take long; never do them with the lock held.
        auto update = updater_.FetchAndParse(source);
        outcome.rule_count = update.parsed.rules.size();

        WriteLock lock(mutex_);
        rule_store_.ReplaceRules(update.list_id, std::move(update.parsed),
                                 std::move(update.compiled_patterns), update.fetched_at);
        outcome.succeeded = true;
    } catch (const EngineError& ex) {
        outcome.rule_count = 0;
        outcome.error_kind = ex.kind();
        outcome.error_message = ex.what();
        LOG(WARNING) << "Failed to refresh filter list " << source.list_id << "; "
                     << ErrorKindName(ex.kind()) << ": " << ex.what();
    } catch (const std::exception& ex) {
        // Anything escaping the updater comes from installing the parsed rules.
        outcome.succeeded = false;
        outcome.rule_count = 0;
        outcome.error_kind = ErrorKind::PARSE;
        outcome.error_message = ex.what();
        LOG(WARNING) << "Failed to install filter list " << source.list_id << "; " << ex.what();
    }

    return outcome;
}

RefreshReport FilterEngine::RefreshFilterLists()
{
    std::vector<FilterListSource> sources;
    {
        ReadLock lock(mutex_);
        for (const auto& list : rule_store_.filter_lists()) {
            if (list.enabled() && HasSourceURL(list)) {
                sources.push_back(ToSource(list));
            }
        }
    }

    LOG(INFO) << "Refreshing " << sources.size() << " filter lists";

    RefreshReport report;
    report.reserve(sources.size());
    for (const auto& source : sources) {
        report.push_back(RefreshSource(source));
    }

    auto failures = std::count_if(report.cbegin(), report.cend(), [](const auto& outcome) {
        return !outcome.succeeded;
    });
    LOG(INFO) << "Filter lists refreshed; failures: " << failures;

    return report;
}

ListRefreshOutcome FilterEngine::RefreshFilterList(const std::string& list_id)
{
    FilterListSource source;
    {
        ReadLock lock(mutex_);
        const auto& list = rule_store_.GetFilterList(list_id);
        ENSURE(RAISE, HasSourceURL(list))(list_id).Require<InvalidArgumentError>();
        source = ToSource(list);
    }

    return RefreshSource(source);
}

std::future<RefreshReport> FilterEngine::RefreshFilterListsAsync()
{
    return std::async(std::launch::async, [this] {
        return RefreshFilterLists();
    });
}

kbase::Pickle FilterEngine::ExportState() const
{
    kbase::Pickle snapshot;

    ReadLock lock(mutex_);

    snapshot << std::string(kSnapshotMagic) << kSnapshotVersion;

    const auto& lists = rule_store_.filter_lists();
    snapshot << static_cast<uint32_t>(lists.size());
    for (const auto& list : lists) {
        snapshot << list;
    }

    auto shields = shield_registry_.Enumerate();
    snapshot << static_cast<uint32_t>(shields.size());
    for (const auto& entry : shields) {
        snapshot << entry;
    }

    snapshot << stats_.stats();

    LOG(INFO) << "State exported; filter lists: " << lists.size() << " site shields: "
              << shields.size() << " bytes: " << snapshot.size();

    return snapshot;
}

void FilterEngine::ImportState(const void* data, size_t size_in_bytes)
{
    ENSURE(RAISE, data != nullptr && size_in_bytes > 0).Require<SnapshotError>();

    // Decode everything before touching the current state.
    kbase::PickleReader snapshot(data, size_in_bytes);

    std::string magic;
    uint32_t version = 0;
    snapshot >> magic >> version;
    ENSURE(RAISE, magic == kSnapshotMagic && version == kSnapshotVersion)(magic)(version)
          .Require<SnapshotError>();

    // Every entry takes up at least 4 bytes, which bounds any count a genuine snapshot has.
    uint32_t list_count = 0;
    snapshot >> list_count;
    ENSURE(RAISE, list_count <= size_in_bytes / 4)(list_count).Require<SnapshotError>();
    std::vector<FilterList> lists;
    std::set<std::string> list_ids;
    for (uint32_t i = 0; i < list_count; ++i) {
        auto list = FilterList::FromSnapshot(snapshot);
        bool unique_id = list_ids.insert(list.id()).second;
        ENSURE(RAISE, unique_id)(list.id()).Require<SnapshotError>();
        lists.push_back(std::move(list));
    }

    if (list_ids.count(kUserRulesListId) == 0) {
        lists.insert(lists.begin(), FilterList(kUserRulesListId, kUserRulesListName,
                                               std::string(), true));
    }

    uint32_t shields_count = 0;
    snapshot >> shields_count;
    ENSURE(RAISE, shields_count <= size_in_bytes / 4)(shields_count).Require<SnapshotError>();
    std::vector<SiteShields> shields;
    for (uint32_t i = 0; i < shields_count; ++i) {
        shields.push_back(ReadSiteShields(snapshot));
    }

    auto stats = ReadGlobalStats(snapshot);

    WriteLock lock(mutex_);
    rule_store_.ResetFilterLists(std::move(lists));
    shield_registry_.Restore(std::move(shields));
    stats_.Restore(stats);

    LOG(INFO) << "State imported; filter lists: " << list_count << " site shields: "
              << shields_count;
}

}   // namespace sse
