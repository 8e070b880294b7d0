/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_FILTER_LIST_H_
#define KSHIELDENGINE_SHIELD_ENGINE_FILTER_LIST_H_

#include <string>

#include "kbase/basic_macros.h"
#include "kbase/pickle.h"

#include "shield_engine/filter_rule.h"
#include "shield_engine/time_util.h"

namespace sse {

// The list holding rules added by the user. It has no source url and is scanned first.
constexpr const char kUserRulesListId[] = "user-rules";

// Header information a subscribed list announces in its leading comments.
struct FilterListInfo {
    std::string version;
    std::string title;
    std::string last_modified;
};

struct ParsedFilterList {
    FilterListInfo info;
    RuleSequence rules;
};

// Parses the whole content of a filter list.
// Throws ParseError if `content` is empty.
ParsedFilterList ParseFilterList(const std::string& content);

// Parses a single line and appends the resulting rule to `rules`.
// Returns false if the line carries no rule, i.e. it is empty, a comment, a section header,
// or has nothing left once the exception prefix and options are stripped.
bool ParseRuleLine(const std::string& line, RuleSequence& rules);

// A FilterList instance represents a named, enable-able sequence of rules that originates
// from `source_url`. Lists without a source url are maintained by hand.
// Rules are never modified in place by a refresh; the whole sequence is replaced.
class FilterList {
public:
    FilterList(std::string id, std::string name, std::string source_url, bool enabled);

    FilterList(FilterList&& other) = default;

    ~FilterList() = default;

    FilterList& operator=(FilterList&& rhs) = default;

    DISALLOW_COPY(FilterList);

    static FilterList FromSnapshot(kbase::PickleReader& snapshot);

    const std::string& id() const
    {
        return id_;
    }

    const std::string& name() const
    {
        return name_;
    }

    const std::string& source_url() const
    {
        return source_url_;
    }

    bool enabled() const
    {
        return enabled_;
    }

    void set_enabled(bool enabled)
    {
        enabled_ = enabled;
    }

    Timestamp last_updated() const
    {
        return last_updated_;
    }

    const FilterListInfo& info() const
    {
        return info_;
    }

    const RuleSequence& rules() const
    {
        return rules_;
    }

    void ReplaceRules(ParsedFilterList parsed, Timestamp updated_at);

    void AppendRule(Rule rule);

    // Removes the first rule equal to `rule`.
    // Returns false if there is no such rule.
    bool RemoveRule(const Rule& rule);

private:
    friend kbase::Pickle& operator<<(kbase::Pickle& pickle, const FilterList& list);

    std::string id_;
    std::string name_;
    std::string source_url_;
    bool enabled_;
    Timestamp last_updated_;
    FilterListInfo info_;
    RuleSequence rules_;
};

kbase::Pickle& operator<<(kbase::Pickle& pickle, const FilterList& list);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_FILTER_LIST_H_
