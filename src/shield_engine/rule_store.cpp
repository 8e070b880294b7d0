/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/rule_store.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include "kbase/error_exception_util.h"

#include "shield_engine/engine_errors.h"

namespace sse {

RuleStore::RuleStore(bool compile_patterns)
    : compile_patterns_(compile_patterns)
{}

std::vector<FilterList>::iterator RuleStore::FindFilterList(const std::string& id)
{
    return std::find_if(filter_lists_.begin(), filter_lists_.end(), [&id](const auto& list) {
        return list.id() == id;
    });
}

std::vector<FilterList>::const_iterator RuleStore::FindFilterList(const std::string& id) const
{
    return std::find_if(filter_lists_.cbegin(), filter_lists_.cend(), [&id](const auto& list) {
        return list.id() == id;
    });
}

bool RuleStore::HasFilterList(const std::string& id) const
{
    return FindFilterList(id) != filter_lists_.cend();
}

void RuleStore::AddFilterList(FilterList list)
{
    ENSURE(RAISE, !HasFilterList(list.id()))(list.id()).Require<InvalidArgumentError>();
    if (compile_patterns_) {
        pattern_cache_.Merge(CompilePatterns(list.rules()));
    }

    filter_lists_.push_back(std::move(list));
}

void RuleStore::RemoveFilterList(const std::string& id)
{
    auto it = FindFilterList(id);
    ENSURE(RAISE, it != filter_lists_.end())(id).Require<NotFoundError>();
    filter_lists_.erase(it);
    PrunePatternCache();
}

FilterList& RuleStore::GetFilterList(const std::string& id)
{
    auto it = FindFilterList(id);
    ENSURE(RAISE, it != filter_lists_.end())(id).Require<NotFoundError>();
    return *it;
}

const FilterList& RuleStore::GetFilterList(const std::string& id) const
{
    auto it = FindFilterList(id);
    ENSURE(RAISE, it != filter_lists_.cend())(id).Require<NotFoundError>();
    return *it;
}

void RuleStore::SetFilterListEnabled(const std::string& id, bool enabled)
{
    GetFilterList(id).set_enabled(enabled);
}

void RuleStore::ReplaceRules(const std::string& id, ParsedFilterList parsed,
                             CompiledPatternMap compiled_patterns, Timestamp updated_at)
{
    FilterList& list = GetFilterList(id);
    list.ReplaceRules(std::move(parsed), updated_at);
    if (compile_patterns_) {
        pattern_cache_.Merge(std::move(compiled_patterns));
        PrunePatternCache();
    }
}

void RuleStore::AppendRule(const std::string& id, Rule rule)
{
    FilterList& list = GetFilterList(id);
    if (compile_patterns_ && !pattern_cache_.Find(rule.pattern)) {
        CompiledPatternMap compiled;
        compiled.emplace(rule.pattern, std::make_shared<const CompiledPattern>(rule.pattern));
        pattern_cache_.Merge(std::move(compiled));
    }

    list.AppendRule(std::move(rule));
}

bool RuleStore::RemoveRule(const std::string& id, const Rule& rule)
{
    bool removed = GetFilterList(id).RemoveRule(rule);
    if (removed) {
        PrunePatternCache();
    }

    return removed;
}

void RuleStore::ResetFilterLists(std::vector<FilterList> lists)
{
    filter_lists_ = std::move(lists);
    pattern_cache_.Clear();
    if (compile_patterns_) {
        for (const auto& list : filter_lists_) {
            pattern_cache_.Merge(CompilePatterns(list.rules()));
        }
    }
}

MatchResult RuleStore::MatchAny(const std::string& request_url, const std::string& resource_type,
                                const std::string& origin_domain) const
{
    return FindMatch(request_url, resource_type, origin_domain).result;
}

RuleMatch RuleStore::FindMatch(const std::string& request_url, const std::string& resource_type,
                               const std::string& origin_domain) const
{
    for (const auto& list : filter_lists_) {
        if (!list.enabled()) {
            continue;
        }

        for (const auto& rule : list.rules()) {
            if (!AppliesOnRequest(rule, origin_domain, resource_type) ||
                !MatchPattern(pattern_cache_, rule.pattern, request_url)) {
                continue;
            }

            // Element hiding and redirect rules never decide whether to block.
            if (rule.kind == RuleKind::BLOCK) {
                return RuleMatch {MatchResult::BLOCKING_MATCHED, &list, &rule};
            }

            if (rule.kind == RuleKind::ALLOW) {
                return RuleMatch {MatchResult::EXCEPTION_MATCHED, &list, &rule};
            }
        }
    }

    return RuleMatch {MatchResult::NOT_MATCHED, nullptr, nullptr};
}

std::vector<FilterListStatus> RuleStore::GetFilterListStatuses() const
{
    std::vector<FilterListStatus> statuses;
    statuses.reserve(filter_lists_.size());
    std::transform(filter_lists_.cbegin(), filter_lists_.cend(), std::back_inserter(statuses),
                   [](const FilterList& list) {
        return FilterListStatus {
            list.id(), list.name(), list.source_url(), list.enabled(), list.last_updated(),
            list.rules().size(), list.info()
        };
    });

    return statuses;
}

void RuleStore::PrunePatternCache()
{
    if (pattern_cache_.size() == 0) {
        return;
    }

    std::unordered_set<std::string> live_patterns;
    for (const auto& list : filter_lists_) {
        for (const auto& rule : list.rules()) {
            live_patterns.insert(rule.pattern);
        }
    }

    pattern_cache_.Retain(live_patterns);
}

}   // namespace sse
