/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_RULE_STORE_H_
#define KSHIELDENGINE_SHIELD_ENGINE_RULE_STORE_H_

#include <string>
#include <vector>

#include "kbase/basic_macros.h"

#include "shield_engine/filter_list.h"
#include "shield_engine/pattern_matcher.h"

namespace sse {

enum class MatchResult {
    NOT_MATCHED,
    BLOCKING_MATCHED,
    EXCEPTION_MATCHED
};

// The rule deciding a request, along with the list carrying it.
// Pointers stay valid until the store is modified.
struct RuleMatch {
    MatchResult result;
    const FilterList* list;
    const Rule* rule;
};

struct FilterListStatus {
    std::string id;
    std::string name;
    std::string source_url;
    bool enabled;
    Timestamp last_updated;
    size_t rule_count;
    FilterListInfo info;
};

// Owns every filter list, in the order they were added, and compiled patterns of their rules.
// Not thread-safe; the owner serializes the access.
class RuleStore {
public:
    explicit RuleStore(bool compile_patterns);

    ~RuleStore() = default;

    DISALLOW_COPY(RuleStore);

    DISALLOW_MOVE(RuleStore);

    // Throws InvalidArgumentError if a list with the same id already exists.
    void AddFilterList(FilterList list);

    // The following methods throw NotFoundError if there is no list identified by `id`.

    void RemoveFilterList(const std::string& id);

    FilterList& GetFilterList(const std::string& id);

    const FilterList& GetFilterList(const std::string& id) const;

    void SetFilterListEnabled(const std::string& id, bool enabled);

    // Installs a freshly parsed rule sequence as a whole, along with compiled patterns for
    // these rules if pattern compilation is on.
    void ReplaceRules(const std::string& id, ParsedFilterList parsed,
                      CompiledPatternMap compiled_patterns, Timestamp updated_at);

    void AppendRule(const std::string& id, Rule rule);

    // Returns false if the list has no such rule.
    bool RemoveRule(const std::string& id, const Rule& rule);

    bool HasFilterList(const std::string& id) const;

    // Replaces all lists, e.g. when restoring a snapshot.
    void ResetFilterLists(std::vector<FilterList> lists);

    // Scans enabled lists in order, and rules of each list in order. The first blocking or
    // exception rule applying to the request decides the result.
    MatchResult MatchAny(const std::string& request_url, const std::string& resource_type,
                         const std::string& origin_domain) const;

    RuleMatch FindMatch(const std::string& request_url, const std::string& resource_type,
                        const std::string& origin_domain) const;

    std::vector<FilterListStatus> GetFilterListStatuses() const;

    const std::vector<FilterList>& filter_lists() const
    {
        return filter_lists_;
    }

    bool compile_patterns() const
    {
        return compile_patterns_;
    }

    const PatternCache& pattern_cache() const
    {
        return pattern_cache_;
    }

private:
    std::vector<FilterList>::iterator FindFilterList(const std::string& id);

    std::vector<FilterList>::const_iterator FindFilterList(const std::string& id) const;

    // Drops compiled patterns no rule refers to any more.
    void PrunePatternCache();

private:
    bool compile_patterns_;
    std::vector<FilterList> filter_lists_;
    PatternCache pattern_cache_;
};

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_RULE_STORE_H_
