/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_FILTER_RULE_H_
#define KSHIELDENGINE_SHIELD_ENGINE_FILTER_RULE_H_

#include <set>
#include <string>
#include <vector>

#include "kbase/pickle.h"

namespace sse {

enum class RuleKind : unsigned int {
    BLOCK,
    ALLOW,
    HIDE,
    REDIRECT
};

enum ResourceFlag : unsigned int {
    SCRIPT = 1U << 0,
    IMAGE = 1U << 1,
    STYLESHEET = 1U << 2,
    XMLHTTPREQUEST = 1U << 3,
    SUBDOCUMENT = 1U << 4,
    THIRD_PARTY = 1U << 5,
    POPUP = 1U << 6
};

constexpr const unsigned int kAllResourceFlags = ResourceFlag::SCRIPT |
                                                 ResourceFlag::IMAGE |
                                                 ResourceFlag::STYLESHEET |
                                                 ResourceFlag::XMLHTTPREQUEST |
                                                 ResourceFlag::SUBDOCUMENT |
                                                 ResourceFlag::THIRD_PARTY |
                                                 ResourceFlag::POPUP;

// An optional set of domains.
// An unspecified scope places no restriction, whereas a specified but empty one matches nothing.
struct DomainScope {
    bool specified;
    std::set<std::string> domains;

    DomainScope();

    explicit DomainScope(std::set<std::string> names);

    bool Contains(const std::string& domain) const;
};

struct Rule {
    RuleKind kind;
    std::string pattern;        // Never empty.
    DomainScope domains;        // Origins the rule is restricted to.
    DomainScope exceptions;     // Origins the rule never applies on.
    unsigned int resource_flags;

    Rule(RuleKind kind, std::string pattern);
};

bool operator==(const Rule& lhs, const Rule& rhs);

inline bool operator!=(const Rule& lhs, const Rule& rhs)
{
    return !(lhs == rhs);
}

using RuleSequence = std::vector<Rule>;

const char* RuleKindName(RuleKind kind);

// Returns true if a rule carrying `resource_flags` applies to requests of `resource_type`.
// Resource types we don't know about are always applicable.
bool AppliesOnResourceType(unsigned int resource_flags, const std::string& resource_type);

// Returns true if both the domain scopes and resource flags of the `rule` admit the request.
// Pattern is not taken into account.
bool AppliesOnRequest(const Rule& rule, const std::string& origin_domain,
                      const std::string& resource_type);

// Reconstructs the filter-list text form of a rule, e.g. `@@allowlisted.com`.
std::string RuleToText(const Rule& rule);

kbase::Pickle& operator<<(kbase::Pickle& pickle, const Rule& rule);

Rule ReadRule(kbase::PickleReader& reader);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_FILTER_RULE_H_
